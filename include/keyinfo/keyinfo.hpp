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

#ifndef KEYINFO_HPP_
#define KEYINFO_HPP_

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "keyinfo_def.h"

namespace keyinfo {

/** One identity claimed for the primary key. */
class UserID {
  public:
    std::string name;
    std::string email;
    std::string comment;

    UserID(){};
    UserID(const std::string &uname,
           const std::string &uemail,
           const std::string &ucomment = std::string())
        : name(uname), email(uemail), comment(ucomment){};

    /** @brief Textual form: non-empty parts of "name <email> (comment)". */
    std::string str() const;
};

/**
 * @brief Metadata of a single primary key or subkey.
 *        Subkeys are stored only within the subkeys member of the primary key, and never
 *        own uids or subkeys themselves.
 */
class Key {
  public:
    std::string         fingerprint;  /* upper-case hex fingerprint */
    std::string         capabilities; /* sorted set of 'a', 'c', 'e', 's', with optional
                                         '+' and inherited subkey capabilities */
    std::string         keytype_name;
    int                 keytype_code;
    unsigned            keysize;
    uint64_t            created;
    uint64_t            expires;  /* 0 means key never expires */
    std::string         validity; /* "?" - unknown, "e" - expired */
    std::vector<UserID> uids;
    std::vector<Key>    subkeys;
    bool                is_subkey;
    bool                on_keychain;

    Key();

    /* Derived properties, evaluated either at the given or the current time */
    bool expired(uint64_t now) const;
    bool expired() const;
    bool usable(uint64_t now) const;
    bool usable() const;
    bool can_encrypt(uint64_t now) const;
    bool can_encrypt() const;
    bool can_sign(uint64_t now) const;
    bool can_sign() const;

    /**
     * @brief Short one-line description of the key: key id (or whole fingerprint), emails,
     *        expiration, algorithm, size and capabilities. Trailing '!' marks unusable key.
     */
    std::string summary(uint64_t now, bool full_fp) const;
    std::string summary(bool full_fp = false) const;

    /** @brief Set validity to expired if key expiration time has passed. */
    void synthesize_validity(uint64_t now);
    /** @brief Append capabilities of the non-expired subkeys after the '+' separator. */
    void add_subkey_capabilities(uint64_t now);
    /**
     * @brief Make sure that email from the external claim is present in the uids list:
     *        either mark matching userids with the origin or add the new userid.
     */
    void ensure_autocrypt_uid(const std::string &addr, const std::string &origin);
};

typedef struct keyinfo_params_t {
    uint64_t    now;              /* reference time, 0 to use the current time */
    std::string autocrypt_addr;   /* address from the external claim, empty if none */
    std::string autocrypt_origin; /* origin label of the external claim */

    keyinfo_params_t() : now(0), autocrypt_origin(KEYINFO_AUTOCRYPT_ORIGIN){};
} keyinfo_params_t;

/**
 * @brief Extract key metadata from the armored or binary OpenPGP data.
 *        Signatures are not validated, data is just parsed.
 *
 * @param data input buffer
 * @param len number of bytes in data
 * @param keys extracted primary keys will be stored here. Always cleared first.
 * @param params reference time and optional external identity claim.
 * @return KEYINFO_SUCCESS if data was parsed (keys may still be empty), or error code if
 *         input is not OpenPGP data at all. In this case keys is left empty.
 */
keyinfo_result_t get_keyinfo(const uint8_t *         data,
                             size_t                  len,
                             std::vector<Key> &      keys,
                             const keyinfo_params_t &params = keyinfo_params_t());

/** @brief Shortcut which returns empty list on any failure. */
std::vector<Key> get_keyinfo(const std::string &     data,
                             const keyinfo_params_t &params = keyinfo_params_t());

/**
 * @brief Run post-processing over assembled keys using the single reference time: validity,
 *        subkey capabilities and external identity claim merge.
 */
void derive_keys(std::vector<Key> &keys, const keyinfo_params_t &params, uint64_t now);

/**
 * @brief Serialize keys to JSON array.
 *
 * @param keys list of the keys
 * @param pretty use pretty-printing
 * @param json on success JSON string will be stored here.
 * @return KEYINFO_SUCCESS or error code.
 */
keyinfo_result_t keys_to_json(const std::vector<Key> &keys, bool pretty, std::string &json);

} // namespace keyinfo

#endif
