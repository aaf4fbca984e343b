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

static const uint64_t NOW = 1700000000;

TEST_F(keyinfo_tests, test_userid_str)
{
    assert_true(UserID().str().empty());
    assert_true(UserID("Alice", "a@example.com").str() == "Alice <a@example.com>");
    assert_true(UserID("", "a@example.com").str() == "<a@example.com>");
    assert_true(UserID("Alice", "").str() == "Alice");
    assert_true(UserID("", "a@example.com", "Autocrypt").str() ==
                "<a@example.com> (Autocrypt)");
    assert_true(UserID("Alice", "a@example.com", "work").str() ==
                "Alice <a@example.com> (work)");
    assert_true(UserID("", "", "note").str() == "(note)");
}

TEST_F(keyinfo_tests, test_key_defaults)
{
    Key key;
    assert_true(key.fingerprint == "MISSING");
    assert_true(key.capabilities.empty());
    assert_true(key.keytype_name == "unknown");
    assert_int_equal(key.keytype_code, 0);
    assert_int_equal(key.keysize, 0U);
    assert_int_equal(key.created, 0U);
    assert_int_equal(key.expires, 0U);
    assert_true(key.validity == "?");
    assert_true(key.uids.empty());
    assert_true(key.subkeys.empty());
    assert_false(key.is_subkey);
    assert_false(key.on_keychain);
    assert_true(key.usable(NOW));
    assert_false(key.expired(NOW));
}

TEST_F(keyinfo_tests, test_key_expiration)
{
    Key key;
    /* never expires */
    assert_false(key.expired(0));
    assert_false(key.expired(UINT64_MAX));
    assert_false(key.expired());

    key.expires = NOW;
    assert_false(key.expired(NOW - 1));
    assert_false(key.expired(NOW));
    assert_true(key.expired(NOW + 1));
    assert_false(key.usable(NOW + 1));

    key.expires = 1;
    assert_true(key.expired());
}

TEST_F(keyinfo_tests, test_key_capabilities)
{
    Key key;
    key.capabilities = "cs";
    assert_true(key.usable(NOW));
    assert_true(key.can_sign(NOW));
    assert_false(key.can_encrypt(NOW));

    key.capabilities = "cs+e";
    assert_true(key.can_sign(NOW));
    assert_true(key.can_encrypt(NOW));

    /* validity codes other than unknown or empty make key unusable */
    key.validity = "";
    assert_true(key.usable(NOW));
    key.validity = "r";
    assert_false(key.usable(NOW));
    assert_false(key.can_sign(NOW));
    assert_false(key.can_encrypt(NOW));

    /* expired key */
    key.validity = "?";
    key.expires = NOW - 10;
    assert_false(key.usable(NOW));
    assert_false(key.can_sign(NOW));
    assert_false(key.can_encrypt(NOW));
    assert_true(key.can_sign(NOW - 20));
}

TEST_F(keyinfo_tests, test_key_summary)
{
    Key key;
    key.fingerprint = "F939021417E8C1E482F72882F40575FEA2E2BEC0";
    key.keytype_name = "RSA Encrypt or Sign";
    key.keysize = 2048;
    key.capabilities = "cs+e";
    assert_true(key.summary(NOW, false) == "F40575FEA2E2BEC0/RSA2048/cs+e");
    assert_true(key.summary(NOW, true) ==
                "F939021417E8C1E482F72882F40575FEA2E2BEC0/RSA2048/cs+e");

    key.uids.emplace_back("Alice", "alice@example.com");
    key.uids.emplace_back("No Email", "");
    key.uids.emplace_back("", "alice@work.example.org");
    assert_true(key.summary(NOW, false) ==
                "F40575FEA2E2BEC0=alice@example.com,alice@work.example.org/RSA2048/cs+e");

    key.uids.clear();
    key.expires = 0x613f4380;
    assert_true(key.summary(NOW - 100000000, false) == "F40575FEA2E2BEC0<613f4380/RSA2048/cs+e");
    /* expired key is marked as unusable */
    assert_true(key.summary(NOW, false) == "F40575FEA2E2BEC0<613f4380/RSA2048/cs+e!");

    /* short fingerprint and short algorithm name are kept as is */
    Key other;
    other.fingerprint = "ABCD";
    other.keytype_name = "EC";
    assert_true(other.summary(NOW, false) == "ABCD/EC0/");
    other.validity = "e";
    assert_true(other.summary(NOW, true) == "ABCD/EC0/!");
    Key missing;
    assert_true(missing.summary(NOW, false) == "MISSING/unk0/");
}

TEST_F(keyinfo_tests, test_key_synthesize_validity)
{
    Key key;
    key.synthesize_validity(NOW);
    assert_true(key.validity == "?");

    key.expires = NOW + 1;
    key.synthesize_validity(NOW);
    assert_true(key.validity == "?");

    key.expires = NOW - 1;
    key.synthesize_validity(NOW);
    assert_true(key.validity == "e");

    key.validity = "";
    key.synthesize_validity(NOW);
    assert_true(key.validity == "e");

    /* other codes are not overwritten */
    key.validity = "r";
    key.synthesize_validity(NOW);
    assert_true(key.validity == "r");
}

TEST_F(keyinfo_tests, test_key_subkey_capabilities)
{
    Key key;
    key.capabilities = "cs";
    /* no subkeys */
    key.add_subkey_capabilities(NOW);
    assert_true(key.capabilities == "cs");

    Key enc;
    enc.is_subkey = true;
    enc.capabilities = "e";
    Key auth;
    auth.is_subkey = true;
    auth.capabilities = "as";
    auth.expires = NOW - 1;
    Key sign;
    sign.is_subkey = true;
    sign.capabilities = "s";
    sign.expires = NOW + 1;
    key.subkeys = {enc, auth, sign};

    key.add_subkey_capabilities(NOW);
    assert_true(key.capabilities == "cs+es");
    /* idempotent */
    key.add_subkey_capabilities(NOW);
    assert_true(key.capabilities == "cs+es");
    /* expired subkey is taken into account at earlier time */
    key.add_subkey_capabilities(NOW - 10);
    assert_true(key.capabilities == "cs+aes");

    /* all subkeys expired */
    key.capabilities = "c";
    key.add_subkey_capabilities(NOW + 100);
    assert_true(key.capabilities == "c+e");
    key.subkeys.erase(key.subkeys.begin());
    key.add_subkey_capabilities(NOW + 100);
    assert_true(key.capabilities == "c+e");

    /* subkeys without capabilities */
    Key empty;
    empty.capabilities = "s";
    empty.subkeys.push_back(Key());
    empty.add_subkey_capabilities(NOW);
    assert_true(empty.capabilities == "s");
}

TEST_F(keyinfo_tests, test_key_autocrypt_uid)
{
    Key key;
    key.uids.emplace_back("Alice", "alice@example.com");
    key.uids.emplace_back("Alice Work", "alice@work.example.org");

    /* matching email */
    key.ensure_autocrypt_uid("alice@example.com", "Autocrypt");
    assert_int_equal(key.uids.size(), 2U);
    assert_true(key.uids[0].comment == "(Autocrypt)");
    assert_true(key.uids[1].comment.empty());
    /* repeated merge does not add uids */
    key.ensure_autocrypt_uid("alice@example.com", "Autocrypt");
    assert_int_equal(key.uids.size(), 2U);
    assert_true(key.uids[0].comment == "(Autocrypt)(Autocrypt)");

    /* non-matching email */
    key.ensure_autocrypt_uid("alice@other.example.net", "Header");
    assert_int_equal(key.uids.size(), 3U);
    assert_true(key.uids[2].name.empty());
    assert_true(key.uids[2].email == "alice@other.example.net");
    assert_true(key.uids[2].comment == "Header");
    key.ensure_autocrypt_uid("alice@other.example.net", "Header");
    assert_int_equal(key.uids.size(), 3U);

    /* email comparison is exact, different case adds a new uid */
    Key upper;
    upper.uids.emplace_back("Alice", "A@Example.com");
    upper.ensure_autocrypt_uid("a@example.com", "Autocrypt");
    assert_int_equal(upper.uids.size(), 2U);
    assert_true(upper.uids[0].comment.empty());
    assert_true(upper.uids[0].str() == "Alice <A@Example.com>");
    assert_true(upper.uids[1].str() == "<a@example.com> (Autocrypt)");

    /* key without uids */
    Key bare;
    bare.ensure_autocrypt_uid("bob@example.com", "Autocrypt");
    assert_int_equal(bare.uids.size(), 1U);
    assert_true(bare.uids[0].str() == "<bob@example.com> (Autocrypt)");

    /* subkeys are never touched */
    Key subkey;
    subkey.is_subkey = true;
    subkey.ensure_autocrypt_uid("bob@example.com", "Autocrypt");
    assert_true(subkey.uids.empty());
}

TEST_F(keyinfo_tests, test_derive_keys)
{
    std::vector<Key> keys(2);
    keys[0].capabilities = "c";
    keys[0].expires = NOW - 1;
    Key sub;
    sub.is_subkey = true;
    sub.capabilities = "e";
    keys[0].subkeys.push_back(sub);
    keys[1].capabilities = "cs";
    keys[1].uids.emplace_back("Bob", "bob@example.com");

    keyinfo_params_t params;
    derive_keys(keys, params, NOW);
    assert_true(keys[0].validity == "e");
    assert_true(keys[0].capabilities == "c+e");
    assert_true(keys[0].uids.empty());
    assert_true(keys[1].validity == "?");
    assert_true(keys[1].capabilities == "cs");

    params.autocrypt_addr = "bob@example.com";
    derive_keys(keys, params, NOW);
    assert_true(keys[0].capabilities == "c+e");
    assert_int_equal(keys[0].uids.size(), 1U);
    assert_true(keys[0].uids[0].comment == "Autocrypt");
    assert_int_equal(keys[1].uids.size(), 1U);
    assert_true(keys[1].uids[0].comment == "(Autocrypt)");
    assert_true(keys[0].subkeys[0].uids.empty());
}
