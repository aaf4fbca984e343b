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

#include <keyinfo/keyinfo.hpp>
#include <inttypes.h>
#include <stdio.h>
#include <algorithm>
#include <set>
#include "time-utils.h"
#include "logging.h"

namespace keyinfo {

std::string
UserID::str() const
{
    std::string res;
    if (!name.empty()) {
        res = name;
    }
    if (!email.empty()) {
        res += (res.empty() ? "<" : " <") + email + ">";
    }
    if (!comment.empty()) {
        res += (res.empty() ? "(" : " (") + comment + ")";
    }
    return res;
}

Key::Key()
    : fingerprint(KEYINFO_FP_MISSING), keytype_name("unknown"), keytype_code(0), keysize(0),
      created(0), expires(0), validity(KEYINFO_VALIDITY_UNKNOWN), is_subkey(false),
      on_keychain(false)
{
}

bool
Key::expired(uint64_t now) const
{
    return expires && (now > expires);
}

bool
Key::expired() const
{
    return expired(keyinfo_time_now());
}

bool
Key::usable(uint64_t now) const
{
    if (!validity.empty() && (validity != KEYINFO_VALIDITY_UNKNOWN)) {
        return false;
    }
    return !expired(now);
}

bool
Key::usable() const
{
    return usable(keyinfo_time_now());
}

bool
Key::can_encrypt(uint64_t now) const
{
    return (capabilities.find('e') != std::string::npos) && usable(now);
}

bool
Key::can_encrypt() const
{
    return can_encrypt(keyinfo_time_now());
}

bool
Key::can_sign(uint64_t now) const
{
    return (capabilities.find('s') != std::string::npos) && usable(now);
}

bool
Key::can_sign() const
{
    return can_sign(keyinfo_time_now());
}

std::string
Key::summary(uint64_t now, bool full_fp) const
{
    std::string res = fingerprint;
    if (!full_fp && (res.size() > KEYINFO_SUMMARY_FP_LEN)) {
        res = res.substr(res.size() - KEYINFO_SUMMARY_FP_LEN);
    }

    std::string emails;
    for (auto &uid : uids) {
        if (uid.email.empty()) {
            continue;
        }
        if (!emails.empty()) {
            emails += ",";
        }
        emails += uid.email;
    }
    if (!emails.empty()) {
        res += "=" + emails;
    }

    if (expires) {
        char buf[32] = {0};
        snprintf(buf, sizeof(buf), "<%" PRIx64, expires);
        res += buf;
    }
    res += "/" + keytype_name.substr(0, 3) + std::to_string(keysize) + "/" + capabilities;
    if (!usable(now)) {
        res += "!";
    }
    return res;
}

std::string
Key::summary(bool full_fp) const
{
    return summary(keyinfo_time_now(), full_fp);
}

void
Key::synthesize_validity(uint64_t now)
{
    if (!expired(now)) {
        return;
    }
    if (validity.empty() || (validity == KEYINFO_VALIDITY_UNKNOWN)) {
        validity = KEYINFO_VALIDITY_EXPIRED;
    }
}

void
Key::add_subkey_capabilities(uint64_t now)
{
    std::set<char> caps;
    for (auto &subkey : subkeys) {
        if (subkey.expired(now)) {
            continue;
        }
        caps.insert(subkey.capabilities.begin(), subkey.capabilities.end());
    }
    if (caps.empty()) {
        return;
    }
    capabilities = capabilities.substr(0, capabilities.find('+')) + "+" +
                   std::string(caps.begin(), caps.end());
}

void
Key::ensure_autocrypt_uid(const std::string &addr, const std::string &origin)
{
    if (is_subkey) {
        return;
    }
    bool found = false;
    for (auto &uid : uids) {
        if (uid.email != addr) {
            continue;
        }
        uid.comment += "(" + origin + ")";
        found = true;
    }
    if (!found) {
        uids.emplace_back("", addr, origin);
    }
}

} // namespace keyinfo
