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

#ifndef STREAM_SIG_H_
#define STREAM_SIG_H_

#include <stdint.h>
#include <stdbool.h>
#include <sys/types.h>
#include <array>
#include <vector>
#include "stream-common.h"
#include "stream-packet.h"
#include "sig_subpacket.hpp"

namespace pgp {
namespace pkt {

/* Signature packet. Signature material is kept raw since signatures are never validated. */
class Signature {
  private:
    pgp_sig_type_t   type_;
    keyinfo_result_t parse_v2v3(pgp_packet_body_t &pkt);
    keyinfo_result_t parse_v4up(pgp_packet_body_t &pkt);
    bool             parse_subpackets(const uint8_t *buf, size_t len, bool hashed);

  public:
    pgp_version_t version;
    /* common v3 and v4 fields */
    pgp_pubkey_alg_t       palg;
    pgp_hash_alg_t         halg;
    std::array<uint8_t, 2> lbits{};
    std::vector<uint8_t>   material_buf; /* raw signature material */

    /* v3 - only fields */
    uint32_t creation_time;

    /* v4 and v5 subpackets, hashed area goes first */
    sigsub::List subpkts;

    Signature()
        : type_(PGP_SIG_BINARY), version(PGP_VUNKNOWN), palg(PGP_PKA_NOTHING),
          halg(PGP_HASH_UNKNOWN), creation_time(0){};

    /* @brief Get signature's type */
    pgp_sig_type_t
    type() const
    {
        return type_;
    };

    /**
     * @brief Parse signature packet body
     * @param pkt packet body with signature packet.
     * @return KEYINFO_SUCCESS or error code if failed.
     */
    keyinfo_result_t parse(pgp_packet_body_t &pkt);
};

} // namespace pkt
} // namespace pgp

#endif
