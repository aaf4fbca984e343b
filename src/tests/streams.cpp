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

#include "keyinfo_tests.h"
#include "support.h"
#include <librepgp/stream-common.h>
#include <librepgp/stream-packet.h>
#include <librepgp/stream-armor.h>

using namespace keyinfo;

static keyinfo_result_t
dearmor_str(const std::string &str, std::vector<uint8_t> &dst)
{
    pgp_source_t src = {};
    init_mem_src(&src, str.data(), str.size());
    return dearmor_source(src, dst);
}

static keyinfo_result_t
read_packets(const std::vector<uint8_t> &data, std::vector<pgp_packet_body_t> &packets)
{
    pgp_source_t src = {};
    init_mem_src(&src, data.data(), data.size());
    return stream_read_packets(src, packets);
}

TEST_F(keyinfo_tests, test_stream_armor_types)
{
    const char *types[] = {"BEGIN PGP MESSAGE",
                           "BEGIN PGP PUBLIC KEY BLOCK",
                           "BEGIN PGP PUBLIC KEY",
                           "BEGIN PGP SECRET KEY BLOCK",
                           "BEGIN PGP PRIVATE KEY BLOCK",
                           "BEGIN PGP SIGNATURE",
                           "BEGIN PGP SIGNED MESSAGE",
                           "BEGIN PGP SOMETHING"};
    pgp_armored_msg_t exp[] = {PGP_ARMORED_MESSAGE,
                               PGP_ARMORED_PUBLIC_KEY,
                               PGP_ARMORED_PUBLIC_KEY,
                               PGP_ARMORED_SECRET_KEY,
                               PGP_ARMORED_SECRET_KEY,
                               PGP_ARMORED_SIGNATURE,
                               PGP_ARMORED_CLEARTEXT,
                               PGP_ARMORED_UNKNOWN};
    for (size_t i = 0; i < sizeof(types) / sizeof(types[0]); i++) {
        assert_int_equal(armor_str_to_data_type(types[i], strlen(types[i])), exp[i]);
    }
    assert_int_equal(armor_str_to_data_type(NULL, 0), PGP_ARMORED_UNKNOWN);

    pgp_source_t src = {};
    std::string  text = "some text\n-----BEGIN PGP PUBLIC KEY BLOCK-----\n";
    init_mem_src(&src, text.data(), text.size());
    assert_true(is_armored_source(&src));
    text = "some text\n-----BEGIN";
    init_mem_src(&src, text.data(), text.size());
    assert_false(is_armored_source(&src));
}

TEST_F(keyinfo_tests, test_stream_dearmor)
{
    std::vector<uint8_t> binary = file_to_vec(data_path("keys/alice-rsa.gpg"));
    std::vector<uint8_t> dearmored;
    assert_keyinfo_success(dearmor_str(file_to_str(data_path("keys/alice-rsa.asc")), dearmored));
    assert_true(dearmored == binary);

    /* CRC mismatch is not fatal */
    dearmored.clear();
    assert_keyinfo_success(
      dearmor_str(file_to_str(data_path("keys/alice-badcrc.asc")), dearmored));
    assert_true(dearmored == binary);

    /* CRLF line endings, headers and no CRC */
    std::string armored = "-----BEGIN PGP PUBLIC KEY BLOCK-----\r\n"
                          "Version: test\r\n"
                          "Comment: some comment\r\n"
                          "\r\n"
                          "AQID\r\n"
                          "BAU=\r\n"
                          "-----END PGP PUBLIC KEY BLOCK-----\r\n";
    dearmored.clear();
    assert_keyinfo_success(dearmor_str(armored, dearmored));
    assert_true(dearmored == std::vector<uint8_t>({1, 2, 3, 4, 5}));

    /* two blocks with text around */
    armored = "Text before\n"
              "-----BEGIN PGP PUBLIC KEY BLOCK-----\n\nAQ==\n"
              "-----END PGP PUBLIC KEY BLOCK-----\n"
              "text between\n"
              "-----BEGIN PGP SIGNATURE-----\n\nAgM=\n-----END PGP SIGNATURE-----\n"
              "text after";
    dearmored.clear();
    assert_keyinfo_success(dearmor_str(armored, dearmored));
    assert_true(dearmored == std::vector<uint8_t>({1, 2, 3}));
}

TEST_F(keyinfo_tests, test_stream_dearmor_failures)
{
    std::vector<uint8_t> dst;
    /* no armor at all */
    assert_int_equal(dearmor_str("just text", dst), KEYINFO_ERROR_BAD_FORMAT);
    /* unknown type */
    assert_int_equal(
      dearmor_str("-----BEGIN PGP SOMETHING-----\n\nAQID\n-----END PGP SOMETHING-----\n", dst),
      KEYINFO_ERROR_BAD_FORMAT);
    /* truncated header line */
    assert_int_equal(dearmor_str("-----BEGIN PGP PUB", dst), KEYINFO_ERROR_BAD_FORMAT);
    /* bad base64 */
    assert_int_equal(dearmor_str("-----BEGIN PGP PUBLIC KEY BLOCK-----\n\nAQ*D\n"
                                 "-----END PGP PUBLIC KEY BLOCK-----\n",
                                 dst),
                     KEYINFO_ERROR_BAD_FORMAT);
    /* wrong padding */
    assert_int_equal(dearmor_str("-----BEGIN PGP PUBLIC KEY BLOCK-----\n\nAQI\n"
                                 "-----END PGP PUBLIC KEY BLOCK-----\n",
                                 dst),
                     KEYINFO_ERROR_BAD_FORMAT);
    /* no trailer */
    assert_int_equal(dearmor_str("-----BEGIN PGP PUBLIC KEY BLOCK-----\n\nAQID\n", dst),
                     KEYINFO_ERROR_BAD_FORMAT);
    /* mismatched trailer */
    assert_int_equal(dearmor_str("-----BEGIN PGP PUBLIC KEY BLOCK-----\n\nAQID\n"
                                 "-----END PGP SIGNATURE-----\n",
                                 dst),
                     KEYINFO_ERROR_BAD_FORMAT);
    /* wrong header */
    assert_int_equal(dearmor_str("-----BEGIN PGP PUBLIC KEY BLOCK-----\nWrong header!\n\nAQID\n"
                                 "-----END PGP PUBLIC KEY BLOCK-----\n",
                                 dst),
                     KEYINFO_ERROR_BAD_FORMAT);
}

TEST_F(keyinfo_tests, test_stream_packet_framing)
{
    auto uid = std::vector<uint8_t>({'A', 'l', 'i', 'c', 'e'});
    /* old format with 1, 2 and 4 octet lengths */
    std::vector<uint8_t> big(70000, 'x');
    std::vector<uint8_t> medium(300, 'y');
    auto                 data = concat({build_old_packet(PGP_PKT_USER_ID, uid),
                        build_old_packet(PGP_PKT_USER_ID, medium),
                        build_old_packet(PGP_PKT_USER_ID, big)});
    assert_int_equal(data[1], 5);
    assert_int_equal(data[7] & 0x03, 1);
    std::vector<pgp_packet_body_t> packets;
    assert_keyinfo_success(read_packets(data, packets));
    assert_int_equal(packets.size(), 3U);
    assert_int_equal(packets[0].tag(), PGP_PKT_USER_ID);
    assert_int_equal(packets[0].size(), 5U);
    assert_int_equal(packets[0].offset(), 0U);
    assert_int_equal(packets[1].size(), 300U);
    assert_int_equal(packets[1].offset(), 7U);
    assert_int_equal(packets[2].size(), 70000U);

    /* new format with 1, 2 and 5 octet lengths */
    data = concat({build_packet(PGP_PKT_USER_ID, uid),
                   build_packet(PGP_PKT_USER_ID, medium),
                   build_packet(PGP_PKT_USER_ID, big)});
    packets.clear();
    assert_keyinfo_success(read_packets(data, packets));
    assert_int_equal(packets.size(), 3U);
    assert_int_equal(packets[1].size(), 300U);
    assert_int_equal(packets[2].size(), 70000U);
    assert_true(std::vector<uint8_t>(packets[2].data(), packets[2].data() + 70000) == big);

    /* old format indeterminate length */
    data = {0x80 | (PGP_PKT_USER_ID << 2) | 3, 'B', 'o', 'b'};
    packets.clear();
    assert_keyinfo_success(read_packets(data, packets));
    assert_int_equal(packets.size(), 1U);
    assert_int_equal(packets[0].size(), 3U);

    /* empty source gives no packets */
    packets.clear();
    assert_keyinfo_success(read_packets({}, packets));
    assert_true(packets.empty());
}

TEST_F(keyinfo_tests, test_stream_packet_partial_length)
{
    /* "Alice <a@example.com>" split into 2 + 4 + 15 octets */
    std::string          text = "Alice <a@example.com>";
    std::vector<uint8_t> data = {0xC0 | PGP_PKT_USER_ID, 0xE1, 'A', 'l', 0xE2, 'i', 'c', 'e', ' '};
    data.push_back(15);
    data.insert(data.end(), text.begin() + 6, text.end());
    std::vector<pgp_packet_body_t> packets;
    assert_keyinfo_success(read_packets(data, packets));
    assert_int_equal(packets.size(), 1U);
    assert_true(std::string((const char *) packets[0].data(), packets[0].size()) == text);

    std::vector<Key> keys;
    data = concat({build_rsa_key(false, TEST_PKT_CREATED), data});
    assert_keyinfo_success(parse_keys(data, keys, TEST_PKT_CREATED));
    assert_int_equal(keys.size(), 1U);
    assert_int_equal(keys[0].uids.size(), 1U);
    assert_true(keys[0].uids[0].email == "a@example.com");

    /* chunk exceeding the data */
    data = {0xC0 | PGP_PKT_USER_ID, 0xE4, 'A', 'l'};
    packets.clear();
    assert_int_equal(read_packets(data, packets), KEYINFO_ERROR_BAD_FORMAT);
    /* missing final chunk */
    data = {0xC0 | PGP_PKT_USER_ID, 0xE1, 'A', 'l'};
    packets.clear();
    assert_int_equal(read_packets(data, packets), KEYINFO_ERROR_BAD_FORMAT);
}

TEST_F(keyinfo_tests, test_stream_packet_framing_failures)
{
    std::vector<pgp_packet_body_t> packets;
    /* first octet without bit 7 */
    assert_int_equal(read_packets({0x3F, 0x01, 0x00}, packets), KEYINFO_ERROR_BAD_FORMAT);
    /* length exceeds the data */
    packets.clear();
    assert_int_equal(read_packets({0xCD, 0x10, 'A', 'B'}, packets), KEYINFO_ERROR_BAD_FORMAT);
    /* truncated header */
    packets.clear();
    assert_int_equal(read_packets({0xCD}, packets), KEYINFO_ERROR_BAD_FORMAT);
    packets.clear();
    assert_int_equal(read_packets({0xCD, 0xFF, 0x00}, packets), KEYINFO_ERROR_BAD_FORMAT);
    /* too large packet */
    packets.clear();
    assert_int_equal(read_packets({0xCD, 0xFF, 0x01, 0x00, 0x00, 0x01, 'A'}, packets),
                     KEYINFO_ERROR_BAD_FORMAT);
    /* valid packet followed by garbage */
    packets.clear();
    auto data = concat({build_userid("Alice"), {0x01, 0x02}});
    assert_int_equal(read_packets(data, packets), KEYINFO_ERROR_BAD_FORMAT);
}
