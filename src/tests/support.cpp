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

#include "support.h"
#include "utils.h"
#include "sig_subpacket.hpp"
#include <fstream>
#include <iterator>
#include <stdarg.h>

std::string
file_to_str(const std::string &path)
{
    std::ifstream infile(path);
    return std::string(std::istreambuf_iterator<char>(infile),
                       std::istreambuf_iterator<char>());
}

std::vector<uint8_t>
file_to_vec(const std::string &path)
{
    std::ifstream stream(path, std::ios::in | std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(stream)),
                                std::istreambuf_iterator<char>());
}

std::string
data_path(const std::string &name)
{
    const char *dir = getenv("KEYINFO_TEST_DATA");
    return keyinfo::path::append(dir ? dir : "data", name);
}

bool
starts_with(const std::string &data, const std::string &match)
{
    return data.find(match) == 0;
}

bool
ends_with(const std::string &data, const std::string &match)
{
    return data.size() >= match.size() &&
           data.substr(data.size() - match.size(), match.size()) == match;
}

std::string
fmt(const char *format, ...)
{
    int     size;
    va_list ap;

    va_start(ap, format);
    size = vsnprintf(NULL, 0, format, ap);
    va_end(ap);

    // +1 for terminating null
    std::string buf(size + 1, '\0');

    va_start(ap, format);
    size = vsnprintf(&buf[0], buf.size(), format, ap);
    va_end(ap);

    // drop terminating null
    buf.resize(size);
    return buf;
}

std::vector<uint8_t>
hex_to_vec(const std::string &hex)
{
    std::vector<uint8_t> res;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        res.push_back((uint8_t) strtoul(hex.substr(i, 2).c_str(), NULL, 16));
    }
    return res;
}

std::vector<uint8_t>
build_packet(uint8_t tag, const std::vector<uint8_t> &body)
{
    std::vector<uint8_t> res = {(uint8_t)(0xC0 | tag)};
    size_t               len = body.size();
    if (len < 192) {
        res.push_back(len);
    } else if (len < 8384) {
        res.push_back(((len - 192) >> 8) + 192);
        res.push_back((len - 192) & 0xff);
    } else {
        uint8_t buf[4];
        write_uint32(buf, len);
        res.push_back(0xff);
        res.insert(res.end(), buf, buf + 4);
    }
    res.insert(res.end(), body.begin(), body.end());
    return res;
}

std::vector<uint8_t>
build_old_packet(uint8_t tag, const std::vector<uint8_t> &body)
{
    std::vector<uint8_t> res;
    size_t               len = body.size();
    uint8_t              ptag = 0x80 | (tag << 2);
    if (len < 256) {
        res = {ptag, (uint8_t) len};
    } else if (len < 65536) {
        res = {(uint8_t)(ptag | 1), (uint8_t)(len >> 8), (uint8_t)(len & 0xff)};
    } else {
        uint8_t buf[4];
        write_uint32(buf, len);
        res = {(uint8_t)(ptag | 2)};
        res.insert(res.end(), buf, buf + 4);
    }
    res.insert(res.end(), body.begin(), body.end());
    return res;
}

std::vector<uint8_t>
build_mpi(const std::vector<uint8_t> &val)
{
    size_t bits = val.size() * 8;
    for (uint8_t mask = 0x80; mask && val.size() && !(val[0] & mask); mask >>= 1) {
        bits--;
    }
    std::vector<uint8_t> res = {(uint8_t)(bits >> 8), (uint8_t)(bits & 0xff)};
    res.insert(res.end(), val.begin(), val.end());
    return res;
}

std::vector<uint8_t>
test_rsa_n()
{
    std::vector<uint8_t> n = {0xC1};
    for (size_t i = 1; i < 256; i++) {
        n.push_back((i * 7 + 1) & 0xff);
    }
    return n;
}

std::vector<uint8_t>
test_rsa_e()
{
    return {0x01, 0x00, 0x01};
}

std::vector<uint8_t>
build_rsa_key_body(uint8_t                     version,
                   uint32_t                    created,
                   uint16_t                    v3_days,
                   const std::vector<uint8_t> &n,
                   const std::vector<uint8_t> &e)
{
    std::vector<uint8_t> body = {version};
    uint8_t              buf[4];
    write_uint32(buf, created);
    body.insert(body.end(), buf, buf + 4);
    if (version < 4) {
        write_uint16(buf, v3_days);
        body.insert(body.end(), buf, buf + 2);
    }
    body.push_back(PGP_PKA_RSA);
    std::vector<uint8_t> material = build_mpi(n);
    std::vector<uint8_t> mpi_e = build_mpi(e);
    material.insert(material.end(), mpi_e.begin(), mpi_e.end());
    if (version == 5) {
        write_uint32(buf, material.size());
        body.insert(body.end(), buf, buf + 4);
    }
    body.insert(body.end(), material.begin(), material.end());
    return body;
}

std::vector<uint8_t>
build_rsa_key(bool subkey, uint32_t created, uint16_t v3_days, uint8_t version)
{
    return build_packet(subkey ? PGP_PKT_PUBLIC_SUBKEY : PGP_PKT_PUBLIC_KEY,
                        build_rsa_key_body(version, created, v3_days, test_rsa_n(), test_rsa_e()));
}

std::vector<uint8_t>
build_userid(const std::string &uid)
{
    return build_packet(PGP_PKT_USER_ID, std::vector<uint8_t>(uid.begin(), uid.end()));
}

std::vector<uint8_t>
build_subpkt(uint8_t type, const std::vector<uint8_t> &data)
{
    std::vector<uint8_t> res = {(uint8_t)(data.size() + 1), type};
    res.insert(res.end(), data.begin(), data.end());
    return res;
}

std::vector<uint8_t>
build_key_flags(uint8_t flags)
{
    return build_subpkt((uint8_t) pgp::pkt::sigsub::Type::KeyFlags, {flags});
}

std::vector<uint8_t>
build_key_expiration(uint32_t secs)
{
    uint8_t buf[4];
    write_uint32(buf, secs);
    return build_subpkt((uint8_t) pgp::pkt::sigsub::Type::KeyExpirationTime,
                        std::vector<uint8_t>(buf, buf + 4));
}

std::vector<uint8_t>
build_signature(uint8_t                     type,
                const std::vector<uint8_t> &hashed,
                const std::vector<uint8_t> &unhashed)
{
    std::vector<uint8_t> body = {4, type, PGP_PKA_RSA, PGP_HASH_SHA256};
    uint8_t              buf[2];
    write_uint16(buf, hashed.size());
    body.insert(body.end(), buf, buf + 2);
    body.insert(body.end(), hashed.begin(), hashed.end());
    write_uint16(buf, unhashed.size());
    body.insert(body.end(), buf, buf + 2);
    body.insert(body.end(), unhashed.begin(), unhashed.end());
    /* left 16 bits of the hash and fake signature mpi */
    body.insert(body.end(), {0xAB, 0xCD});
    std::vector<uint8_t> sig = build_mpi(std::vector<uint8_t>(256, 0x5A));
    body.insert(body.end(), sig.begin(), sig.end());
    return build_packet(PGP_PKT_SIGNATURE, body);
}

std::vector<uint8_t>
concat(const std::vector<std::vector<uint8_t>> &parts)
{
    std::vector<uint8_t> res;
    for (auto &part : parts) {
        res.insert(res.end(), part.begin(), part.end());
    }
    return res;
}

keyinfo_result_t
parse_keys(const std::vector<uint8_t> &data, std::vector<keyinfo::Key> &keys, uint64_t now)
{
    keyinfo::keyinfo_params_t params;
    params.now = now;
    return keyinfo::get_keyinfo(data.data(), data.size(), keys, params);
}

static bool
jso_get_field(json_object *obj, json_object **fld, const std::string &name)
{
    if (!obj || !json_object_is_type(obj, json_type_object)) {
        return false;
    }
    return json_object_object_get_ex(obj, name.c_str(), fld);
}

bool
check_json_field_str(json_object *obj, const std::string &field, const std::string &value)
{
    json_object *fld = NULL;
    if (!jso_get_field(obj, &fld, field)) {
        return false;
    }
    if (!json_object_is_type(fld, json_type_string)) {
        return false;
    }
    const char *jsoval = json_object_get_string(fld);
    return jsoval && (value == jsoval);
}

bool
check_json_field_int(json_object *obj, const std::string &field, int64_t value)
{
    json_object *fld = NULL;
    if (!jso_get_field(obj, &fld, field)) {
        return false;
    }
    if (!json_object_is_type(fld, json_type_int)) {
        return false;
    }
    return json_object_get_int64(fld) == value;
}

bool
check_json_field_bool(json_object *obj, const std::string &field, bool value)
{
    json_object *fld = NULL;
    if (!jso_get_field(obj, &fld, field)) {
        return false;
    }
    if (!json_object_is_type(fld, json_type_boolean)) {
        return false;
    }
    return json_object_get_boolean(fld) == value;
}
