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

#include "crypto/hash.hpp"
#include "crypto/mem.h"
#include <librepgp/stream-key.h>
#include <librepgp/stream-packet.h>
#include "utils.h"
#include "fingerprint.hpp"

namespace pgp {

/* Hash key's public data in the way it is done for the v4/v5 fingerprint */
static void
fingerprint_hash_key(const pgp_key_pkt_t &key, keyinfo::Hash &hash)
{
    if (key.version == PGP_V4) {
        if (key.pub_data.size() > 0xffff) {
            KEYINFO_LOG("key public data too large: %zu", key.pub_data.size());
            throw keyinfo::keyinfo_exception(KEYINFO_ERROR_BAD_FORMAT);
        }
        uint8_t hdr[3] = {0x99, 0x00, 0x00};
        write_uint16(hdr + 1, key.pub_data.size());
        hash.add(hdr, 3);
    } else {
        uint8_t hdr[5] = {0x9A, 0x00, 0x00, 0x00, 0x00};
        write_uint32(hdr + 1, key.pub_data.size());
        hash.add(hdr, 5);
    }
    hash.add(key.pub_data);
}

Fingerprint::Fingerprint()
{
}

Fingerprint::Fingerprint(const uint8_t *data, size_t size) : fp_(data, data + size)
{
}

Fingerprint::Fingerprint(const pgp_key_pkt_t &key)
{
    switch (key.version) {
    case PGP_V2:
    case PGP_V3: {
        /* v2/3 fingerprint is calculated from RSA public numbers */
        auto rsa = dynamic_cast<const pgp::RSAKeyMaterial *>(key.material.get());
        if (!is_rsa_key_alg(key.alg) || !rsa) {
            KEYINFO_LOG("no RSA material for v%d key", (int) key.version);
            throw keyinfo::keyinfo_exception(KEYINFO_ERROR_NOT_SUPPORTED);
        }
        auto hash = keyinfo::Hash::create(PGP_HASH_MD5);
        hash->add(rsa->n().data(), rsa->n().size());
        hash->add(rsa->e().data(), rsa->e().size());
        fp_ = hash->finish();
        return;
    }
    case PGP_V4:
    case PGP_V5: {
        auto halg = key.version == PGP_V4 ? PGP_HASH_SHA1 : PGP_HASH_SHA256;
        auto hash = keyinfo::Hash::create(halg);
        fingerprint_hash_key(key, *hash);
        fp_ = hash->finish();
        return;
    }
    default:
        KEYINFO_LOG("unsupported key version: %d", (int) key.version);
        throw keyinfo::keyinfo_exception(KEYINFO_ERROR_NOT_SUPPORTED);
    }
}

bool
Fingerprint::operator==(const Fingerprint &src) const
{
    return fp_ == src.fp_;
}

bool
Fingerprint::operator!=(const Fingerprint &src) const
{
    return !(*this == src);
}

bool
Fingerprint::size_valid(size_t size) noexcept
{
    return (size == PGP_FINGERPRINT_V4_SIZE) || (size == PGP_FINGERPRINT_V3_SIZE) ||
           (size == PGP_FINGERPRINT_V5_SIZE);
}

const std::vector<uint8_t> &
Fingerprint::vec() const noexcept
{
    return fp_;
}

const uint8_t *
Fingerprint::data() const noexcept
{
    return fp_.data();
}

size_t
Fingerprint::size() const noexcept
{
    return fp_.size();
}

std::string
Fingerprint::str() const
{
    return keyinfo::bin_to_hex(fp_, keyinfo::HexFormat::Uppercase);
}

} // namespace pgp
