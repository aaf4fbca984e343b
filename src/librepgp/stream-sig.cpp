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

#include <string.h>
#include <inttypes.h>
#include "stream-sig.h"
#include "utils.h"

/* maximum number of subpackets in single (hashed or unhashed) area */
#define MAX_SUBPACKETS 64

namespace pgp {
namespace pkt {

keyinfo_result_t
Signature::parse_v2v3(pgp_packet_body_t &pkt)
{
    /* parse v2/v3-specific fields, not the whole signature */
    uint8_t buf[16] = {};
    if (!pkt.get(buf, 16)) {
        KEYINFO_LOG("cannot get enough bytes");
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    /* length of hashed data, 5 */
    if (buf[0] != 5) {
        KEYINFO_LOG("wrong length of hashed data");
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    /* signature type */
    type_ = (pgp_sig_type_t) buf[1];
    /* creation time */
    creation_time = read_uint32(&buf[2]);
    /* signer's key id goes in buf[6..13] and is not needed */
    /* public key algorithm */
    palg = (pgp_pubkey_alg_t) buf[14];
    /* hash algorithm */
    halg = (pgp_hash_alg_t) buf[15];
    return KEYINFO_SUCCESS;
}

bool
Signature::parse_subpackets(const uint8_t *buf, size_t len, bool hashed)
{
    size_t count = 0;

    while (len) {
        if (count >= MAX_SUBPACKETS) {
            KEYINFO_LOG("too many signature subpackets");
            return false;
        }
        if (len < 2) {
            KEYINFO_LOG("got single byte %" PRIu8, *buf);
            return false;
        }

        /* subpacket length */
        size_t splen = *buf++;
        len--;
        if ((splen >= 192) && (splen < 255)) {
            splen = ((splen - 192) << 8) + *buf++ + 192;
            len--;
        } else if (splen == 255) {
            if (len < 4) {
                KEYINFO_LOG("got 4-byte len but only %zu bytes in buffer", len);
                return false;
            }
            splen = read_uint32(buf);
            buf += 4;
            len -= 4;
        }

        if (!splen) {
            KEYINFO_LOG("got subpacket with 0 length");
            return false;
        }

        /* subpacket data */
        if (len < splen) {
            KEYINFO_LOG("got subpacket len %zu, while only %zu bytes left", splen, len);
            return false;
        }

        subpkts.items.push_back(sigsub::Raw::create(buf, splen, hashed));
        count++;
        len -= splen;
        buf += splen;
    }
    return true;
}

keyinfo_result_t
Signature::parse_v4up(pgp_packet_body_t &pkt)
{
    /* parse v4 (and up) specific fields, not the whole signature */
    uint8_t buf[3];
    if (!pkt.get(buf, 3)) {
        KEYINFO_LOG("cannot get first 3 bytes");
        return KEYINFO_ERROR_BAD_FORMAT;
    }

    /* signature type */
    type_ = (pgp_sig_type_t) buf[0];
    /* public key algorithm */
    palg = (pgp_pubkey_alg_t) buf[1];
    /* hash algorithm */
    halg = (pgp_hash_alg_t) buf[2];

    /* hashed subpackets */
    uint16_t splen = 0;
    if (!pkt.get(splen)) {
        KEYINFO_LOG("cannot get hashed len");
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    if (pkt.left() < splen) {
        KEYINFO_LOG("wrong packet or hashed subpackets length");
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    if (!parse_subpackets(pkt.cur(), splen, true)) {
        KEYINFO_LOG("failed to parse hashed subpackets");
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    pkt.skip(splen);

    /* unhashed subpackets */
    if (!pkt.get(splen)) {
        KEYINFO_LOG("cannot get unhashed len");
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    if (pkt.left() < splen) {
        KEYINFO_LOG("not enough data for unhashed subpackets");
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    if (!parse_subpackets(pkt.cur(), splen, false)) {
        KEYINFO_LOG("failed to parse unhashed subpackets");
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    pkt.skip(splen);
    return KEYINFO_SUCCESS;
}

keyinfo_result_t
Signature::parse(pgp_packet_body_t &pkt)
{
    if (pkt.tag() != PGP_PKT_SIGNATURE) {
        KEYINFO_LOG("wrong signature tag: %d", (int) pkt.tag());
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    pkt.rewind();
    uint8_t ver = 0;
    if (!pkt.get(ver)) {
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    version = (pgp_version_t) ver;

    /* v3 or v4 signature body */
    keyinfo_result_t res;
    switch (ver) {
    case PGP_V2:
    case PGP_V3:
        res = parse_v2v3(pkt);
        break;
    case PGP_V4:
    case PGP_V5:
        res = parse_v4up(pkt);
        break;
    default:
        KEYINFO_LOG("unknown signature version: %d", (int) ver);
        res = KEYINFO_ERROR_BAD_FORMAT;
    }

    if (res) {
        return res;
    }

    /* left 16 bits of the hash */
    if (!pkt.get(lbits.data(), 2)) {
        KEYINFO_LOG("not enough data for hash left bits");
        return KEYINFO_ERROR_BAD_FORMAT;
    }

    /* raw signature material */
    if (!pkt.get(material_buf, pkt.left())) {
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    return KEYINFO_SUCCESS;
}

} // namespace pkt
} // namespace pgp
