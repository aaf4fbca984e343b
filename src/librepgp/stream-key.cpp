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
#include "stream-key.h"
#include "str-utils.h"
#include "utils.h"

keyinfo_result_t
pgp_key_pkt_t::parse(pgp_packet_body_t &pkt)
{
    /* check the key tag */
    if (!is_public_key_pkt(pkt.tag())) {
        KEYINFO_LOG("wrong key packet tag: %d", (int) pkt.tag());
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    pkt.rewind();
    tag = pkt.tag();
    /* version */
    uint8_t ver = 0;
    if (!pkt.get(ver)) {
        KEYINFO_LOG("unable to retrieve key packet version");
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    switch (ver) {
    case PGP_V2:
    case PGP_V3:
    case PGP_V4:
    case PGP_V5:
        break;
    default:
        KEYINFO_LOG("wrong key packet version %" PRIu8, ver);
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    version = (pgp_version_t) ver;
    /* creation time */
    if (!pkt.get(creation_time)) {
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    /* v3: validity days */
    if ((version < PGP_V4) && !pkt.get(v3_days)) {
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    /* key algorithm */
    uint8_t analg = 0;
    if (!pkt.get(analg)) {
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    alg = (pgp_pubkey_alg_t) analg;
    /* v5 public key material length */
    if ((version == PGP_V5) && !pkt.get(v5_pub_len)) {
        KEYINFO_LOG("failed to get v5 octet count field");
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    if ((version == PGP_V5) && (v5_pub_len != pkt.left())) {
        KEYINFO_LOG("Warning: v5 octet count mismatch");
    }

    /* algorithm specific fields */
    material = pgp::KeyMaterial::create(alg);
    if (material && !material->parse(pkt)) {
        KEYINFO_LOG("failed to parse key material of alg %d at %zu", (int) alg, pkt.offset());
        material = nullptr;
    }
    if (material && pkt.left()) {
        KEYINFO_LOG("extra %zu bytes in key packet", pkt.left());
    }
    /* fill hashed data used for fingerprint */
    if (material) {
        pub_data.assign(pkt.data(), pkt.cur());
    } else {
        pub_data.assign(pkt.data(), pkt.data() + pkt.size());
    }
    return KEYINFO_SUCCESS;
}

void
userid_split(const std::string &uid, std::string &name, std::string &email)
{
    name.clear();
    email.clear();

    std::string text = keyinfo::strip_ws(uid);
    size_t      lt = text.find('<');
    size_t      gt = lt == std::string::npos ? lt : text.find('>', lt);
    if (gt != std::string::npos) {
        name = keyinfo::strip_ws(text.substr(0, lt));
        email = keyinfo::strip_ws(text.substr(lt + 1, gt - lt - 1));
        return;
    }
    if ((text.find('@') != std::string::npos) &&
        (text.find_first_of(" \t<>") == std::string::npos)) {
        email = text;
        return;
    }
    name = text;
}

keyinfo_result_t
pgp_userid_pkt_t::parse(pgp_packet_body_t &pkt)
{
    /* check the tag */
    if (pkt.tag() != PGP_PKT_USER_ID) {
        KEYINFO_LOG("wrong userid tag: %d", (int) pkt.tag());
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    tag = pkt.tag();
    uid.assign((const char *) pkt.data(), pkt.size());
    userid_split(uid, name, email);
    return KEYINFO_SUCCESS;
}
