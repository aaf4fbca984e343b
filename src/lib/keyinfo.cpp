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
#include <algorithm>
#include <keyinfo/keyinfo.hpp>
#include <librepgp/stream-common.h>
#include <librepgp/stream-packet.h>
#include <librepgp/stream-armor.h>
#include "key-builder.hpp"
#include "time-utils.h"
#include "logging.h"

static const char ARMOR_MARKER[] = "-----BEGIN";

static bool
has_armor_marker(const uint8_t *data, size_t len)
{
    const uint8_t *mend = (const uint8_t *) ARMOR_MARKER + strlen(ARMOR_MARKER);
    return std::search(data, data + len, (const uint8_t *) ARMOR_MARKER, mend) != data + len;
}

namespace keyinfo {

void
derive_keys(std::vector<Key> &keys, const keyinfo_params_t &params, uint64_t now)
{
    for (auto &key : keys) {
        key.synthesize_validity(now);
        key.add_subkey_capabilities(now);
        if (!params.autocrypt_addr.empty()) {
            key.ensure_autocrypt_uid(params.autocrypt_addr, params.autocrypt_origin);
        }
    }
}

keyinfo_result_t
get_keyinfo(const uint8_t *         data,
            size_t                  len,
            std::vector<Key> &      keys,
            const keyinfo_params_t &params)
{
    keys.clear();
    if (!data && len) {
        return KEYINFO_ERROR_BAD_PARAMETERS;
    }
    if (!len) {
        KEYINFO_LOG("empty input");
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    uint64_t now = params.now ? params.now : keyinfo_time_now();

    std::vector<pgp_packet_body_t> packets;
    try {
        pgp_source_t src = {};
        init_mem_src(&src, data, len);
        std::vector<uint8_t> binary;
        if (has_armor_marker(data, len)) {
            keyinfo_result_t ret = dearmor_source(src, binary);
            if (ret) {
                KEYINFO_LOG("failed to dearmor input, error 0x%x", (unsigned) ret);
                return ret;
            }
            init_mem_src(&src, binary.data(), binary.size());
        }
        keyinfo_result_t ret = stream_read_packets(src, packets);
        if (ret) {
            KEYINFO_LOG("failed to read packets, error 0x%x", (unsigned) ret);
            return ret;
        }
        /* packets own their data, so binary may go away */
    } catch (const std::bad_alloc &e) {
        KEYINFO_LOG("%s", e.what());
        return KEYINFO_ERROR_OUT_OF_MEMORY;
    }

    std::vector<Key> res;
    KeyBuilder       builder(res);
    for (auto &pkt : packets) {
        builder.add_packet(pkt);
    }
    if (builder.skipped()) {
        KEYINFO_LOG("%zu packet(s) were skipped", builder.skipped());
    }
    derive_keys(res, params, now);
    keys = std::move(res);
    return KEYINFO_SUCCESS;
}

std::vector<Key>
get_keyinfo(const std::string &data, const keyinfo_params_t &params)
{
    std::vector<Key> keys;
    if (get_keyinfo((const uint8_t *) data.data(), data.size(), keys, params)) {
        keys.clear();
    }
    return keys;
}

} // namespace keyinfo
