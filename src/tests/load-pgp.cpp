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

using namespace keyinfo;

#define ALICE_FP "F939021417E8C1E482F72882F40575FEA2E2BEC0"
#define ALICE_SUB_FP "04652497617026E3208D6470ECC660B29CF243F6"
#define BOB_FP "37A386F3DCA67C78EFCCAEC27FA3BD92D98774DE"
#define BOB_SUB_FP "551D766763A9FDC94098DB597E18C34AE1BE5139"
#define CAROL_FP "E04C01E5E0B147D0C5622FAC8C1464741B06BC1A"
#define CAROL_SUB_FP "DEE973367AE233B74D959F26EE75D382B9FC2A39"

#define BOB_EXPIRES 1631536000
#define BOB_SUB_EXPIRES 1600172800

static std::vector<Key>
load_keys(const std::string &name, uint64_t now, const std::string &autocrypt = "")
{
    keyinfo_params_t params;
    params.now = now;
    params.autocrypt_addr = autocrypt;
    std::vector<Key> keys;
    std::vector<uint8_t> data = file_to_vec(data_path(name));
    if (get_keyinfo(data.data(), data.size(), keys, params)) {
        keys.clear();
    }
    return keys;
}

static void
check_alice(const Key &key)
{
    assert_true(key.fingerprint == ALICE_FP);
    assert_true(key.capabilities == "cs+e");
    assert_true(key.keytype_name == "RSA Encrypt or Sign");
    assert_int_equal(key.keytype_code, PGP_PKA_RSA);
    assert_int_equal(key.keysize, 2048U);
    assert_int_equal(key.created, (uint64_t) TEST_KEYS_CREATED);
    assert_int_equal(key.expires, (uint64_t) 0);
    assert_true(key.validity == "?");
    assert_false(key.is_subkey);
    assert_false(key.on_keychain);
    assert_int_equal(key.uids.size(), 2U);
    assert_true(key.uids[0].name == "Alice");
    assert_true(key.uids[0].email == "alice@example.com");
    assert_true(key.uids[0].comment.empty());
    assert_true(key.uids[1].name == "Alice Work");
    assert_true(key.uids[1].email == "alice@work.example.org");
    assert_int_equal(key.subkeys.size(), 1U);
    const Key &sub = key.subkeys[0];
    assert_true(sub.fingerprint == ALICE_SUB_FP);
    assert_true(sub.capabilities == "e");
    assert_int_equal(sub.keysize, 2048U);
    assert_true(sub.is_subkey);
    assert_true(sub.uids.empty());
    assert_true(sub.subkeys.empty());
}

TEST_F(keyinfo_tests, test_load_rsa_key)
{
    auto keys = load_keys("keys/alice-rsa.gpg", TEST_KEYS_CREATED + 100);
    assert_int_equal(keys.size(), 1U);
    check_alice(keys[0]);
    assert_true(keys[0].usable(TEST_KEYS_CREATED + 100));
    assert_true(keys[0].can_encrypt(TEST_KEYS_CREATED + 100));
    assert_true(keys[0].can_sign(TEST_KEYS_CREATED + 100));
    assert_true(keys[0].summary(TEST_KEYS_CREATED + 100, false) ==
                "F40575FEA2E2BEC0=alice@example.com,alice@work.example.org/RSA2048/cs+e");
    assert_true(keys[0].summary(TEST_KEYS_CREATED + 100, true) ==
                ALICE_FP "=alice@example.com,alice@work.example.org/RSA2048/cs+e");

    /* armored version must give the same result */
    keys = load_keys("keys/alice-rsa.asc", TEST_KEYS_CREATED + 100);
    assert_int_equal(keys.size(), 1U);
    check_alice(keys[0]);
    /* as well as the one with wrong CRC */
    keys = load_keys("keys/alice-badcrc.asc", TEST_KEYS_CREATED + 100);
    assert_int_equal(keys.size(), 1U);
    check_alice(keys[0]);
}

TEST_F(keyinfo_tests, test_load_25519_key)
{
    uint64_t now = TEST_KEYS_CREATED + 100;
    auto     keys = load_keys("keys/bob-25519.asc", now);
    assert_int_equal(keys.size(), 1U);
    Key &key = keys[0];
    assert_true(key.fingerprint == BOB_FP);
    assert_true(key.keytype_name == "EdDSA");
    assert_int_equal(key.keytype_code, PGP_PKA_EDDSA);
    assert_int_equal(key.keysize, 255U);
    assert_int_equal(key.created, (uint64_t) TEST_KEYS_CREATED);
    assert_int_equal(key.expires, (uint64_t) BOB_EXPIRES);
    assert_true(key.capabilities == "cs+e");
    assert_true(key.validity == "?");
    assert_int_equal(key.uids.size(), 1U);
    assert_true(key.uids[0].str() == "Bob <bob@example.com>");
    assert_int_equal(key.subkeys.size(), 1U);
    assert_true(key.subkeys[0].fingerprint == BOB_SUB_FP);
    assert_true(key.subkeys[0].keytype_name == "Elliptic Curve");
    assert_int_equal(key.subkeys[0].keytype_code, PGP_PKA_ECDH);
    assert_int_equal(key.subkeys[0].keysize, 255U);
    assert_int_equal(key.subkeys[0].expires, (uint64_t) BOB_SUB_EXPIRES);
    assert_true(key.subkeys[0].capabilities == "e");
    assert_true(key.summary(now, false) ==
                "7FA3BD92D98774DE=bob@example.com<613f4380/EdD255/cs+e");
    assert_true(key.can_sign(now));
    assert_false(key.can_encrypt(now));
    assert_true(key.subkeys[0].can_encrypt(now));

    /* subkey has expired, primary is still valid */
    now = BOB_SUB_EXPIRES + 86400;
    keys = load_keys("keys/bob-25519.asc", now);
    assert_int_equal(keys.size(), 1U);
    assert_true(keys[0].capabilities == "cs");
    assert_true(keys[0].validity == "?");
    assert_true(keys[0].subkeys[0].validity == "?");
    assert_false(keys[0].subkeys[0].usable(now));
    assert_true(keys[0].usable(now));
    assert_true(keys[0].summary(now, false) ==
                "7FA3BD92D98774DE=bob@example.com<613f4380/EdD255/cs");

    /* exactly at the expiration moment key is still valid */
    keys = load_keys("keys/bob-25519.asc", BOB_EXPIRES);
    assert_int_equal(keys.size(), 1U);
    assert_true(keys[0].validity == "?");
    assert_true(keys[0].usable(BOB_EXPIRES));

    /* everything has expired */
    now = 1700000000;
    keys = load_keys("keys/bob-25519.asc", now);
    assert_int_equal(keys.size(), 1U);
    assert_true(keys[0].validity == "e");
    assert_true(keys[0].capabilities == "cs");
    assert_false(keys[0].usable(now));
    assert_false(keys[0].can_sign(now));
    assert_true(keys[0].summary(now, false) ==
                "7FA3BD92D98774DE=bob@example.com<613f4380/EdD255/cs!");
}

TEST_F(keyinfo_tests, test_load_dsa_key)
{
    uint64_t now = TEST_KEYS_CREATED + 100;
    auto     keys = load_keys("keys/carol-dsa.gpg", now);
    assert_int_equal(keys.size(), 1U);
    Key &key = keys[0];
    assert_true(key.fingerprint == CAROL_FP);
    assert_true(key.keytype_name == "DSA Digital Signature Algorithm");
    assert_int_equal(key.keysize, 2048U);
    assert_true(key.capabilities == "cs+e");
    assert_int_equal(key.uids.size(), 1U);
    assert_true(key.uids[0].name.empty());
    assert_true(key.uids[0].email == "carol@example.net");
    assert_int_equal(key.subkeys.size(), 1U);
    assert_true(key.subkeys[0].fingerprint == CAROL_SUB_FP);
    assert_true(key.subkeys[0].keytype_name == "ElGamal Encrypt-Only");
    assert_int_equal(key.subkeys[0].keytype_code, PGP_PKA_ELGAMAL);
    assert_int_equal(key.subkeys[0].keysize, 2048U);
    assert_true(key.summary(now, false) == "8C1464741B06BC1A=carol@example.net/DSA2048/cs+e");
    assert_true(key.subkeys[0].summary(now, false) == "EE75D382B9FC2A39/ElG2048/e");
}

TEST_F(keyinfo_tests, test_load_keyring)
{
    auto keys = load_keys("keys/keyring.gpg", TEST_KEYS_CREATED + 100);
    assert_int_equal(keys.size(), 3U);
    check_alice(keys[0]);
    assert_true(keys[1].fingerprint == BOB_FP);
    assert_int_equal(keys[1].subkeys.size(), 1U);
    assert_true(keys[2].fingerprint == CAROL_FP);
    assert_int_equal(keys[2].subkeys.size(), 1U);

    /* two armored blocks with text around */
    keys = load_keys("keys/two-blocks.asc", TEST_KEYS_CREATED + 100);
    assert_int_equal(keys.size(), 2U);
    assert_true(keys[0].fingerprint == BOB_FP);
    assert_true(keys[1].fingerprint == CAROL_FP);
}

TEST_F(keyinfo_tests, test_load_autocrypt)
{
    /* matching email */
    auto keys = load_keys("keys/alice-rsa.gpg", TEST_KEYS_CREATED + 100, "alice@example.com");
    assert_int_equal(keys.size(), 1U);
    assert_int_equal(keys[0].uids.size(), 2U);
    assert_true(keys[0].uids[0].comment == "(Autocrypt)");
    assert_true(keys[0].uids[0].str() == "Alice <alice@example.com> ((Autocrypt))");
    assert_true(keys[0].uids[1].comment.empty());
    assert_true(keys[0].subkeys[0].uids.empty());

    /* email in different case does not match */
    keys = load_keys("keys/alice-rsa.gpg", TEST_KEYS_CREATED + 100, "ALICE@example.com");
    assert_int_equal(keys.size(), 1U);
    assert_int_equal(keys[0].uids.size(), 3U);
    assert_true(keys[0].uids[0].comment.empty());
    assert_true(keys[0].uids[2].str() == "<ALICE@example.com> (Autocrypt)");

    /* new email is added as separate userid */
    keys = load_keys("keys/carol-dsa.gpg", TEST_KEYS_CREATED + 100, "carol@other.example.net");
    assert_int_equal(keys.size(), 1U);
    assert_int_equal(keys[0].uids.size(), 2U);
    assert_true(keys[0].uids[1].name.empty());
    assert_true(keys[0].uids[1].email == "carol@other.example.net");
    assert_true(keys[0].uids[1].comment == "Autocrypt");
    assert_true(keys[0].summary(TEST_KEYS_CREATED + 100, false) ==
                "8C1464741B06BC1A=carol@example.net,carol@other.example.net/DSA2048/cs+e");

    /* claim is applied to every primary key */
    keys = load_keys("keys/keyring.gpg", TEST_KEYS_CREATED + 100, "dave@example.com");
    assert_int_equal(keys.size(), 3U);
    for (auto &key : keys) {
        assert_true(key.uids.back().email == "dave@example.com");
    }
}

TEST_F(keyinfo_tests, test_load_failures)
{
    assert_true(load_keys("keys/not-a-key.txt", TEST_KEYS_CREATED).empty());
    std::vector<Key> keys(1);
    std::string      text = file_to_str(data_path("keys/not-a-key.txt"));
    assert_int_equal(get_keyinfo((const uint8_t *) text.data(), text.size(), keys),
                     KEYINFO_ERROR_BAD_FORMAT);
    assert_true(keys.empty());

    /* empty input */
    keys.resize(1);
    uint8_t empty = 0;
    assert_int_equal(get_keyinfo(&empty, 0, keys), KEYINFO_ERROR_BAD_FORMAT);
    assert_true(keys.empty());
    assert_int_equal(get_keyinfo(NULL, 0, keys), KEYINFO_ERROR_BAD_FORMAT);
    assert_int_equal(get_keyinfo(NULL, 10, keys), KEYINFO_ERROR_BAD_PARAMETERS);
    assert_true(get_keyinfo(std::string()).empty());

    /* truncated binary keyring */
    std::vector<uint8_t> data = file_to_vec(data_path("keys/keyring.gpg"));
    data.resize(data.size() - 10);
    assert_int_equal(get_keyinfo(data.data(), data.size(), keys), KEYINFO_ERROR_BAD_FORMAT);
    assert_true(keys.empty());
    assert_true(get_keyinfo(std::string(data.begin(), data.end())).empty());

    /* armored message which is not a key: nothing to extract */
    std::string msg = "-----BEGIN PGP MESSAGE-----\n\n"
                      "yAtiAAAAAABoZWxsbw==\n"
                      "-----END PGP MESSAGE-----\n";
    assert_keyinfo_success(
      get_keyinfo((const uint8_t *) msg.data(), msg.size(), keys, keyinfo_params_t()));
    assert_true(keys.empty());

    /* armor marker inside of the binary data */
    data = file_to_vec(data_path("keys/alice-rsa.gpg"));
    std::string marker = "-----BEGIN";
    data.insert(data.end(), marker.begin(), marker.end());
    assert_keyinfo_failure(get_keyinfo(data.data(), data.size(), keys));
}

TEST_F(keyinfo_tests, test_load_string_api)
{
    keyinfo_params_t params;
    params.now = TEST_KEYS_CREATED + 100;
    auto keys = get_keyinfo(file_to_str(data_path("keys/alice-rsa.asc")), params);
    assert_int_equal(keys.size(), 1U);
    check_alice(keys[0]);

    std::vector<uint8_t> bin = file_to_vec(data_path("keys/alice-rsa.gpg"));
    keys = get_keyinfo(std::string(bin.begin(), bin.end()), params);
    assert_int_equal(keys.size(), 1U);
    check_alice(keys[0]);
}
