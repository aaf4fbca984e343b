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

#ifndef SUPPORT_H_
#define SUPPORT_H_

#include <string>
#include <vector>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <stdio.h>
#include <unistd.h>
#include <sys/stat.h>

#include <keyinfo/keyinfo.hpp>
#include "file-utils.h"
#include "crypto/mem.h"
#include "json.h"

/* Reference time of the test keys, generated at 2020-09-13 12:26:40 UTC */
#define TEST_KEYS_CREATED 1600000000
/* Creation time of the keys built by the helpers below */
#define TEST_PKT_CREATED 1500000000

/* Read file contents into the std::string */
std::string file_to_str(const std::string &path);

/* Read binary file contents into the vector */
std::vector<uint8_t> file_to_vec(const std::string &path);

/* Full path of the file within the test data directory */
std::string data_path(const std::string &name);

bool starts_with(const std::string &data, const std::string &match);
bool ends_with(const std::string &data, const std::string &match);
std::string fmt(const char *format, ...);

/* Decode hex string, used to define test vectors */
std::vector<uint8_t> hex_to_vec(const std::string &hex);

/*
 * Helpers to build OpenPGP packets. All of them return complete packet, including the
 * new-format header, unless stated otherwise.
 */

/* Add new format packet header to the body */
std::vector<uint8_t> build_packet(uint8_t tag, const std::vector<uint8_t> &body);
/* Add old format packet header with 1, 2 or 4 octet length */
std::vector<uint8_t> build_old_packet(uint8_t tag, const std::vector<uint8_t> &body);

/* MPI with bit count prefix */
std::vector<uint8_t> build_mpi(const std::vector<uint8_t> &val);

/* 2048-bit RSA modulus and exponent used in tests */
std::vector<uint8_t> test_rsa_n();
std::vector<uint8_t> test_rsa_e();

/* RSA key packet body of the given version, v3_days is used only for v2/v3 */
std::vector<uint8_t> build_rsa_key_body(uint8_t                     version,
                                        uint32_t                    created,
                                        uint16_t                    v3_days,
                                        const std::vector<uint8_t> &n,
                                        const std::vector<uint8_t> &e);

/* RSA primary key or subkey packet, v4 */
std::vector<uint8_t> build_rsa_key(bool subkey, uint32_t created, uint16_t v3_days = 0,
                                   uint8_t version = 4);

std::vector<uint8_t> build_userid(const std::string &uid);

/* Signature subpacket with 1-octet length */
std::vector<uint8_t> build_subpkt(uint8_t type, const std::vector<uint8_t> &data);
std::vector<uint8_t> build_key_flags(uint8_t flags);
std::vector<uint8_t> build_key_expiration(uint32_t secs);

/* v4 signature packet with already encoded subpacket areas */
std::vector<uint8_t> build_signature(uint8_t                     type,
                                     const std::vector<uint8_t> &hashed,
                                     const std::vector<uint8_t> &unhashed = {});

/* Concatenate packets */
std::vector<uint8_t> concat(const std::vector<std::vector<uint8_t>> &parts);

/* Parse packets from the buffer, returning the result code */
keyinfo_result_t parse_keys(const std::vector<uint8_t> &data,
                            std::vector<keyinfo::Key> & keys,
                            uint64_t                    now);

/* Get field of the JSON object, checking its type */
bool check_json_field_str(json_object *obj, const std::string &field, const std::string &value);
bool check_json_field_int(json_object *obj, const std::string &field, int64_t value);
bool check_json_field_bool(json_object *obj, const std::string &field, bool value);

#endif /* SUPPORT_H_ */
