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

#include <algorithm>
#include <set>
#include "key-builder.hpp"
#include "types.h"
#include "utils.h"

static const id_str_pair pubkey_alg_labels[] = {
  {PGP_PKA_RSA, "RSA Encrypt or Sign"},
  {PGP_PKA_RSA_ENCRYPT_ONLY, "RSA Encrypt-Only"},
  {PGP_PKA_RSA_SIGN_ONLY, "RSA Sign-Only"},
  {PGP_PKA_ELGAMAL, "ElGamal Encrypt-Only"},
  {PGP_PKA_DSA, "DSA Digital Signature Algorithm"},
  {PGP_PKA_ECDH, "Elliptic Curve"},
  {PGP_PKA_ECDSA, "ECDSA"},
  {PGP_PKA_ELGAMAL_ENCRYPT_OR_SIGN, "Formerly ElGamal Encrypt or Sign"},
  {PGP_PKA_RESERVED_DH, "Diffie-Hellman"},
  {PGP_PKA_EDDSA, "EdDSA"},
  {PGP_PKA_SM2, "SM2"},
  {0, NULL},
};

/* key flag bits and corresponding capability letters */
static const struct {
    uint8_t flags;
    char    cap;
} key_flag_caps[] = {
  {PGP_KF_CERTIFY, 'c'},
  {PGP_KF_SIGN, 's'},
  {PGP_KF_ENCRYPT, 'e'},
  {PGP_KF_AUTH, 'a'},
};

namespace keyinfo {

const char *
pubkey_alg_label(int alg)
{
    return id_str_pair::lookup(pubkey_alg_labels, alg, "Unknown");
}

unsigned
key_size(const pgp_key_pkt_t &pkt)
{
    if (!pkt.material) {
        return 0;
    }
    auto rsa = dynamic_cast<const pgp::RSAKeyMaterial *>(pkt.material.get());
    if (!rsa) {
        return pkt.material->bits();
    }
    /* 1.024 * round(hexdigits / 0.256), with rounding half to even, in integers */
    uint64_t digits = rsa->n().hex_digits();
    uint64_t quot = (digits * 125) / 32;
    uint64_t rem = (digits * 125) % 32;
    if ((rem > 16) || ((rem == 16) && (quot & 1))) {
        quot++;
    }
    return (unsigned) ((quot * 128) / 125);
}

std::string
merge_key_flags(const std::string &caps, uint8_t flags)
{
    std::set<char> res(caps.begin(), caps.end());
    for (auto &kf : key_flag_caps) {
        if (flags & kf.flags) {
            res.insert(kf.cap);
        }
    }
    return std::string(res.begin(), res.end());
}

void
apply_signature(Key &key, const pgp::pkt::Signature &sig)
{
    using namespace pgp::pkt;
    for (auto &subpkt : sig.subpkts) {
        switch (subpkt->raw_type()) {
        case (uint8_t) sigsub::Type::KeyExpirationTime: {
            auto exp = dynamic_cast<const sigsub::KeyExpirationTime *>(subpkt.get());
            if (!exp) {
                KEYINFO_LOG("malformed key expiration subpacket, len %zu",
                            subpkt->data().size());
                throw keyinfo_exception(KEYINFO_ERROR_BAD_FORMAT);
            }
            /* zero duration means the key never expires */
            if (!exp->time()) {
                break;
            }
            uint64_t expires = key.created + exp->time();
            if ((expires < key.expires) || !key.expires) {
                key.expires = expires;
            }
            break;
        }
        case (uint8_t) sigsub::Type::KeyFlags: {
            auto flags = dynamic_cast<const sigsub::KeyFlags *>(subpkt.get());
            if (!flags) {
                KEYINFO_LOG("malformed key flags subpacket");
                throw keyinfo_exception(KEYINFO_ERROR_BAD_FORMAT);
            }
            key.capabilities = merge_key_flags(key.capabilities, flags->flags());
            break;
        }
        default:
            break;
        }
    }
}

void
KeyBuilder::add_key(const pgp_key_pkt_t &pkt, const pgp::Fingerprint &fp)
{
    Key key;
    if (fp.size()) {
        key.fingerprint = fp.str();
    }
    key.keytype_name = pubkey_alg_label(pkt.alg);
    key.keytype_code = pkt.alg;
    key.keysize = key_size(pkt);
    key.created = pkt.creation_time;
    if (pkt.v3_days) {
        key.expires = key.created + (uint64_t) pkt.v3_days * 86400;
        if (key.expires == key.created) {
            key.expires = 0;
        }
    }

    if (is_primary_key_pkt(pkt.tag)) {
        keys_.push_back(std::move(key));
        current_ = &keys_.back();
        return;
    }
    if (keys_.empty()) {
        KEYINFO_LOG("subkey %s without the primary key, skipping", key.fingerprint.c_str());
        skipped_++;
        return;
    }
    key.is_subkey = true;
    keys_.back().subkeys.push_back(std::move(key));
    current_ = &keys_.back().subkeys.back();
}

void
KeyBuilder::add_key(const pgp_key_pkt_t &pkt)
{
    pgp::Fingerprint fp;
    try {
        fp = pgp::Fingerprint(pkt);
    } catch (const keyinfo_exception &e) {
        if (e.code() != KEYINFO_ERROR_NOT_SUPPORTED) {
            throw;
        }
        KEYINFO_LOG("cannot calculate fingerprint of v%d key", (int) pkt.version);
    }
    add_key(pkt, fp);
}

void
KeyBuilder::add_userid(const pgp_userid_pkt_t &uid)
{
    if (keys_.empty()) {
        KEYINFO_LOG("userid '%s' without the key, skipping", uid.uid.c_str());
        skipped_++;
        return;
    }
    keys_.back().uids.emplace_back(uid.name, uid.email);
}

void
KeyBuilder::add_signature(const pgp::pkt::Signature &sig)
{
    if (!current_) {
        KEYINFO_LOG("signature without the key, skipping");
        skipped_++;
        return;
    }
    apply_signature(*current_, sig);
}

bool
KeyBuilder::add_packet(pgp_packet_body_t &pkt) noexcept
{
    try {
        keyinfo_result_t ret = KEYINFO_SUCCESS;
        switch (pkt.tag()) {
        case PGP_PKT_PUBLIC_KEY:
        case PGP_PKT_PUBLIC_SUBKEY: {
            /* following signatures must not be applied to the previous key */
            current_ = nullptr;
            pgp_key_pkt_t key;
            if (!(ret = key.parse(pkt))) {
                add_key(key);
            }
            break;
        }
        case PGP_PKT_USER_ID: {
            pgp_userid_pkt_t uid;
            if (!(ret = uid.parse(pkt))) {
                add_userid(uid);
            }
            break;
        }
        case PGP_PKT_SIGNATURE: {
            pgp::pkt::Signature sig;
            if (!(ret = sig.parse(pkt))) {
                add_signature(sig);
            }
            break;
        }
        default:
            return true;
        }
        if (ret) {
            KEYINFO_LOG("failed to parse packet %d at %zu, error 0x%x",
                        (int) pkt.tag(),
                        pkt.offset(),
                        (unsigned) ret);
            skipped_++;
            return false;
        }
        return true;
    } catch (const std::exception &e) {
        KEYINFO_LOG("packet %d at %zu: %s", (int) pkt.tag(), pkt.offset(), e.what());
        skipped_++;
        return false;
    }
}

} // namespace keyinfo
