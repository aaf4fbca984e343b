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
#include "json-utils.h"
#include "logging.h"

namespace keyinfo {

static json_object *
uid_to_json(const UserID &uid)
{
    JSONObject jso(json_object_new_object());
    if (!jso.get()) {
        return NULL;
    }
    if (!json_add(jso.get(), "name", uid.name) || !json_add(jso.get(), "email", uid.email) ||
        !json_add(jso.get(), "comment", uid.comment)) {
        return NULL;
    }
    return jso.release();
}

static json_object *
key_to_json(const Key &key)
{
    JSONObject jso(json_object_new_object());
    json_object *obj = jso.get();
    if (!obj) {
        return NULL;
    }
    if (!json_add(obj, "fingerprint", key.fingerprint) ||
        !json_add(obj, "capabilities", key.capabilities) ||
        !json_add(obj, "keytype_name", key.keytype_name) ||
        !json_add(obj, "keytype_code", key.keytype_code) ||
        !json_add(obj, "keysize", (int) key.keysize) || !json_add(obj, "created", key.created) ||
        !json_add(obj, "expires", key.expires) || !json_add(obj, "validity", key.validity) ||
        !json_add(obj, "is_subkey", key.is_subkey) ||
        !json_add(obj, "on_keychain", key.on_keychain)) {
        return NULL;
    }
    /* subkeys never own uids or subkeys */
    if (key.is_subkey) {
        return jso.release();
    }

    json_object *jsouids = json_object_new_array();
    if (!json_add(obj, "uids", jsouids)) {
        return NULL;
    }
    for (auto &uid : key.uids) {
        if (!json_array_add(jsouids, uid_to_json(uid))) {
            return NULL;
        }
    }
    json_object *jsosubs = json_object_new_array();
    if (!json_add(obj, "subkeys", jsosubs)) {
        return NULL;
    }
    for (auto &subkey : key.subkeys) {
        if (!json_array_add(jsosubs, key_to_json(subkey))) {
            return NULL;
        }
    }
    return jso.release();
}

keyinfo_result_t
keys_to_json(const std::vector<Key> &keys, bool pretty, std::string &json)
{
    JSONObject jso(json_object_new_array());
    if (!jso.get()) {
        return KEYINFO_ERROR_OUT_OF_MEMORY;
    }
    for (auto &key : keys) {
        if (!json_array_add(jso.get(), key_to_json(key))) {
            KEYINFO_LOG("failed to serialize key %s", key.fingerprint.c_str());
            return KEYINFO_ERROR_OUT_OF_MEMORY;
        }
    }
    int         flags = pretty ? JSON_C_TO_STRING_PRETTY : JSON_C_TO_STRING_PLAIN;
    const char *str = json_object_to_json_string_ext(jso.get(), flags);
    if (!str) {
        return KEYINFO_ERROR_OUT_OF_MEMORY;
    }
    json = str;
    return KEYINFO_SUCCESS;
}

} // namespace keyinfo
