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
#include "file-utils.h"
#include <errno.h>

static const char TEST_FILENAME[] = "file-utils-test.bin";

TEST_F(keyinfo_tests, test_file_exists)
{
    assert_true(keyinfo_file_exists(data_path("keys/alice-rsa.gpg").c_str()));
    assert_false(keyinfo_file_exists(data_path("keys/no-such-file.gpg").c_str()));
    /* directory is not a file */
    assert_false(keyinfo_file_exists(data_path("keys").c_str()));

    struct stat st = {};
    assert_int_equal(0, keyinfo_stat(data_path("keys/alice-rsa.gpg").c_str(), &st));
    assert_int_equal(st.st_size, 1595);
    assert_int_equal(-1, keyinfo_stat(data_path("keys/no-such-file.gpg").c_str(), &st));
}

TEST_F(keyinfo_tests, test_read_file)
{
    std::vector<uint8_t> data;
    assert_true(keyinfo::read_file(data_path("keys/alice-rsa.gpg"), data, 1 << 20));
    assert_int_equal(data.size(), 1595U);
    assert_true(data == file_to_vec(data_path("keys/alice-rsa.gpg")));

    /* contents is appended */
    assert_true(keyinfo::read_file(data_path("keys/not-a-key.txt"), data, 1 << 20));
    assert_int_equal(data.size(), 1595U + 37U);

    data.clear();
    assert_false(keyinfo::read_file(data_path("keys/no-such-file.gpg"), data, 1 << 20));
    assert_true(data.empty());

    /* limit */
    errno = 0;
    assert_false(keyinfo::read_file(data_path("keys/alice-rsa.gpg"), data, 1000));
    assert_int_equal(errno, EFBIG);
    data.clear();
    assert_true(keyinfo::read_file(data_path("keys/alice-rsa.gpg"), data, 1595));

    /* empty file */
    FILE *fp = keyinfo_fopen(TEST_FILENAME, "wb");
    assert_non_null(fp);
    fclose(fp);
    data.clear();
    assert_true(keyinfo::read_file(TEST_FILENAME, data, 1000));
    assert_true(data.empty());
    assert_int_equal(0, unlink(TEST_FILENAME));
}

TEST_F(keyinfo_tests, test_read_stream)
{
    FILE *fp = keyinfo_fopen(TEST_FILENAME, "w+b");
    assert_non_null(fp);
    std::vector<uint8_t> src(10000, 0x5A);
    assert_int_equal(fwrite(src.data(), 1, src.size(), fp), src.size());
    rewind(fp);
    std::vector<uint8_t> data;
    assert_true(keyinfo::read_stream(fp, data, 10000));
    assert_true(data == src);
    rewind(fp);
    data.clear();
    assert_false(keyinfo::read_stream(fp, data, 9999));
    fclose(fp);
    assert_int_equal(0, unlink(TEST_FILENAME));
}

TEST_F(keyinfo_tests, test_path_append)
{
    using keyinfo::path::append;
    assert_true(append("data", "keys") == "data/keys");
    assert_true(append("data/", "keys") == "data/keys");
    assert_true(append("data", "/keys") == "data/keys");
    assert_true(append("data/", "/keys") == "data/keys");
    assert_true(append("", "keys") == "keys");
    assert_true(append("data", "") == "data");
    assert_true(append("/", "keys/alice.gpg") == "/keys/alice.gpg");
    assert_int_equal(keyinfo::path::separator(), '/');
}
