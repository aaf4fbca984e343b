/*
 * Copyright (c) 2018-2025, [Ribose Inc](https://www.ribose.com).
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without modification,
 * are permitted provided that the following conditions are met:
 *
 * 1.  Redistributions of source code must retain the above copyright notice,
 *     this list of conditions and the following disclaimer.
 *
 * 2.  Redistributions in binary form must reproduce the above copyright notice,
 *     this list of conditions and the following disclaimer in the documentation
 *     and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
 * ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE LIABLE
 * FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
 * DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
 * SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
 * CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
 * OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF
 * THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include "hash_crc24.hpp"

#define CRC24_INIT 0xB704CEL
#define CRC24_POLY 0x1864CFBL

namespace keyinfo {

CRC24_KEYINFO::CRC24_KEYINFO() : state_(CRC24_INIT)
{
}

CRC24_KEYINFO::~CRC24_KEYINFO()
{
}

std::unique_ptr<CRC24_KEYINFO>
CRC24_KEYINFO::create()
{
    return std::unique_ptr<CRC24_KEYINFO>(new CRC24_KEYINFO());
}

void
CRC24_KEYINFO::add(const void *buf, size_t len)
{
    const uint8_t *bytes = (const uint8_t *) buf;
    uint32_t       crc = state_;

    for (size_t i = 0; i < len; i++) {
        crc ^= (uint32_t) bytes[i] << 16;
        for (int bit = 0; bit < 8; bit++) {
            crc <<= 1;
            if (crc & 0x1000000) {
                crc ^= CRC24_POLY;
            }
        }
    }
    state_ = crc & 0xFFFFFF;
}

std::array<uint8_t, 3>
CRC24_KEYINFO::finish()
{
    std::array<uint8_t, 3> res;
    res[0] = (state_ >> 16) & 0xff;
    res[1] = (state_ >> 8) & 0xff;
    res[2] = state_ & 0xff;
    state_ = CRC24_INIT;
    return res;
}

} // namespace keyinfo
