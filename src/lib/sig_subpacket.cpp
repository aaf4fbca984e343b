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

#include <inttypes.h>
#include "sig_subpacket.hpp"
#include "utils.h"

namespace pgp {
namespace pkt {
namespace sigsub {

Raw::Raw(uint8_t rawtype, bool hashed, bool critical)
    : hashed_(hashed), raw_type_(rawtype), critical_(critical), type_(Type::Unknown)
{
}

Raw::Raw(Type type, bool hashed, bool critical)
    : hashed_(hashed), raw_type_(static_cast<uint8_t>(type)), critical_(critical), type_(type)
{
}

Raw::~Raw()
{
}

bool
Raw::check_size(size_t size) const noexcept
{
    return true;
};

bool
Raw::parse_data(const uint8_t *data, size_t size)
{
    return true;
};

bool
Raw::parse(const uint8_t *data, size_t size)
{
    if (!check_size(size)) {
        KEYINFO_LOG("wrong len %zu of subpacket type %" PRIu8, size, raw_type_);
        return false;
    }
    if (!parse_data(data, size)) {
        return false;
    }
    data_.assign(data, data + size);
    return true;
}

RawPtr
Raw::create(uint8_t type, bool hashed, bool critical)
{
    switch (type) {
    case (uint8_t) Type::CreationTime:
        return RawPtr(new CreationTime(hashed, critical));
    case (uint8_t) Type::ExpirationTime:
        return RawPtr(new ExpirationTime(hashed, critical));
    case (uint8_t) Type::KeyExpirationTime:
        return RawPtr(new KeyExpirationTime(hashed, critical));
    case (uint8_t) Type::KeyFlags:
        return RawPtr(new KeyFlags(hashed, critical));
    default:
        return RawPtr(new Raw(type, hashed, critical));
    }
}

RawPtr
Raw::create(Type type, bool hashed, bool critical)
{
    return create(static_cast<uint8_t>(type), hashed, critical);
}

RawPtr
Raw::create(const uint8_t *data, size_t size, bool hashed)
{
    if (!size) {
        KEYINFO_LOG("got subpacket with 0 length");
        return nullptr;
    }
    bool    critical = data[0] & 0x80;
    uint8_t type = data[0] & 0x7f;
    auto    sub = create(type, hashed, critical);
    if (sub->parse(data + 1, size - 1)) {
        return sub;
    }
    /* keep malformed subpacket untyped, so consumer may detect it */
    sub = RawPtr(new Raw(type, hashed, critical));
    (void) sub->parse(data + 1, size - 1);
    return sub;
}

/* Timestamp-based subpackets abstract parent */
bool
Time::check_size(size_t size) const noexcept
{
    return size == 4;
}

bool
Time::parse_data(const uint8_t *data, size_t size)
{
    time_ = read_uint32(data);
    return true;
}

bool
Flags::check_size(size_t size) const noexcept
{
    return size >= 1;
}

bool
Flags::parse_data(const uint8_t *data, size_t size)
{
    flags_ = data[0];
    return true;
}

size_t
List::count(bool hashed) const
{
    size_t res = 0;
    for (auto &item : items) {
        res += item->hashed() == hashed;
    }
    return res;
}

} // namespace sigsub
} // namespace pkt
} // namespace pgp
