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

#ifndef STREAM_KEY_H_
#define STREAM_KEY_H_

#include <stdint.h>
#include <stdbool.h>
#include <sys/types.h>
#include <memory>
#include <string>
#include "stream-common.h"
#include "stream-packet.h"
#include "key_material.hpp"

/** Struct to hold a key packet. May contain public key or subkey */
typedef struct pgp_key_pkt_t {
    pgp_pkt_type_t   tag;           /* packet tag: public key/subkey */
    pgp_version_t    version;       /* Key packet version */
    uint32_t         creation_time; /* Key creation time */
    pgp_pubkey_alg_t alg;
    uint16_t         v3_days;    /* v2/v3 validity time */
    uint32_t         v5_pub_len; /* v5 public key material length */

    std::vector<uint8_t> pub_data; /* key's hashed data used for fingerprint calculation */

    /* nullptr if algorithm is unknown or material is malformed */
    std::unique_ptr<pgp::KeyMaterial> material;

    pgp_key_pkt_t()
        : tag(PGP_PKT_RESERVED), version(PGP_VUNKNOWN), creation_time(0), alg(PGP_PKA_NOTHING),
          v3_days(0), v5_pub_len(0), material(nullptr){};
    pgp_key_pkt_t(const pgp_key_pkt_t &src) = delete;
    pgp_key_pkt_t(pgp_key_pkt_t &&src) = default;
    pgp_key_pkt_t &operator=(const pgp_key_pkt_t &src) = delete;
    pgp_key_pkt_t &operator=(pgp_key_pkt_t &&src) = default;

    /**
     * @brief Parse key packet. Unknown algorithm or malformed key material are tolerated:
     *        then material is left empty and pub_data contains the whole packet body.
     * @return KEYINFO_SUCCESS or error code if fixed key packet fields are missing.
     */
    keyinfo_result_t parse(pgp_packet_body_t &pkt);
} pgp_key_pkt_t;

/** Struct to hold userid packet. Text is split into name and email parts. */
typedef struct pgp_userid_pkt_t {
    pgp_pkt_type_t tag;
    std::string    uid;
    std::string    name;
    std::string    email;

    pgp_userid_pkt_t() : tag(PGP_PKT_RESERVED){};

    keyinfo_result_t parse(pgp_packet_body_t &pkt);
} pgp_userid_pkt_t;

/**
 * @brief Split userid text into name and email.
 *        "Name <email>" gives trimmed name and email between the brackets, bare address
 *        gives just an email, and everything else goes to the name.
 */
void userid_split(const std::string &uid, std::string &name, std::string &email);

#endif
