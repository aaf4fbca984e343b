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

#ifndef KEYINFO_KEY_BUILDER_HPP_
#define KEYINFO_KEY_BUILDER_HPP_

#include <vector>
#include <string>
#include <keyinfo/keyinfo.hpp>
#include <librepgp/stream-packet.h>
#include <librepgp/stream-key.h>
#include <librepgp/stream-sig.h>
#include "fingerprint.hpp"

namespace keyinfo {

/**
 * @brief Builds the list of top-level keys from the sequence of OpenPGP packets, in a single
 *        forward pass. Each packet is processed in isolation: failure to process one packet
 *        is logged and does not stop the processing of the following ones.
 */
class KeyBuilder {
    std::vector<Key> &keys_;
    Key *             current_; /* key which receives signatures, primary or subkey */
    size_t            skipped_;

  public:
    KeyBuilder(std::vector<Key> &keys) : keys_(keys), current_(nullptr), skipped_(0){};

    /**
     * @brief Process a single packet of any type. Never throws.
     * @return true if packet was processed or ignored, false if it was faulty.
     */
    bool add_packet(pgp_packet_body_t &pkt) noexcept;

    /**
     * @brief Add primary key or subkey from the parsed packet. Fingerprint is calculated from
     *        the packet, if possible.
     */
    void add_key(const pgp_key_pkt_t &pkt);
    /** @brief Same as previous but with the already known fingerprint. */
    void add_key(const pgp_key_pkt_t &pkt, const pgp::Fingerprint &fp);
    void add_userid(const pgp_userid_pkt_t &uid);
    void add_signature(const pgp::pkt::Signature &sig);

    /* number of faulty or skipped packets */
    size_t
    skipped() const noexcept
    {
        return skipped_;
    }
};

/**
 * @brief Apply key expiration and key flags subpackets of the signature to the key.
 *        Throws keyinfo_exception if one of those subpackets is malformed, leaving changes of
 *        the preceding subpackets in place.
 */
void apply_signature(Key &key, const pgp::pkt::Signature &sig);

/**
 * @brief Merge key flags octet into the capabilities string, keeping it sorted and
 *        deduplicated.
 */
std::string merge_key_flags(const std::string &caps, uint8_t flags);

/** @brief Key size in bits, as reported in key summary. */
unsigned key_size(const pgp_key_pkt_t &pkt);

/** @brief Human-readable label of the public key algorithm. */
const char *pubkey_alg_label(int alg);

} // namespace keyinfo

#endif
