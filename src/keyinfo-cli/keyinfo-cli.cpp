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

#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <unistd.h> /* getopt() */
#include <getopt.h>
#include <libgen.h> /* basename() */
#include <string>
#include <vector>
#include <keyinfo/keyinfo.hpp>
#include "file-utils.h"
#include "str-utils.h"
#include "time-utils.h"

#define PFX "keyinfo: "

/* Input larger than this is refused */
#define KEYINFO_CLI_INPUT_LIMIT (64 * 1024 * 1024)

#define ERR_MSG(...)                           \
    do {                                       \
        (void) fprintf((stderr), __VA_ARGS__); \
        (void) fprintf((stderr), "\n");        \
    } while (0)

static void
print_usage(char *program_name)
{
    fprintf(stderr,
            PFX
            "Program prints metadata of OpenPGP keys. \n\nUsage:\n"
            "\t%s [-j] [-f] [-a addr] [-o origin] [-n now] [-h] [file ...]\n"
            "\t  -j : JSON output\n"
            "\t  -f : print full fingerprints in summaries\n"
            "\t  -a : email address, claimed for the key by an external source\n"
            "\t  -o : origin label of the claimed address, Autocrypt by default\n"
            "\t  -n : reference time as Unix timestamp, current time by default\n"
            "\t  -h : prints help and exits\n",
            basename(program_name));
}

static const char *
yes_no(bool val)
{
    return val ? "true" : "false";
}

static void
print_key(const keyinfo::Key &key, uint64_t now, bool full_fp)
{
    printf("pub  %s\n", key.summary(now, full_fp).c_str());
    printf("     created %s", keyinfo_strtime(key.created).c_str());
    if (key.expires) {
        printf(", %s %s",
               key.expired(now) ? "expired" : "expires",
               keyinfo_strtime(key.expires).c_str());
    }
    printf("\n");
    for (auto &uid : key.uids) {
        printf("uid  %s\n", uid.str().c_str());
    }
    for (auto &subkey : key.subkeys) {
        printf("sub  %s\n", subkey.summary(now, full_fp).c_str());
    }
    printf("Is usable = %s, Can encrypt = %s, Can sign = %s\n\n",
           yes_no(key.usable(now)),
           yes_no(key.can_encrypt(now)),
           yes_no(key.can_sign(now)));
}

static bool
process_input(const char *                     name,
              const std::vector<uint8_t> &     data,
              const keyinfo::keyinfo_params_t &params,
              bool                             json,
              bool                             full_fp)
{
    std::vector<keyinfo::Key> keys;
    keyinfo_result_t          ret = keyinfo::get_keyinfo(data.data(), data.size(), keys, params);
    if (ret) {
        ERR_MSG(PFX "%s: not OpenPGP key data [error code: 0x%X]", name, ret);
        return false;
    }
    if (json) {
        std::string out;
        ret = keyinfo::keys_to_json(keys, true, out);
        if (ret) {
            ERR_MSG(PFX "%s: failed to build JSON [error code: 0x%X]", name, ret);
            return false;
        }
        printf("%s\n", out.c_str());
        return true;
    }
    if (keys.empty()) {
        ERR_MSG(PFX "%s: no keys found", name);
    }
    for (auto &key : keys) {
        print_key(key, params.now, full_fp);
    }
    return true;
}

int
main(int argc, char *const argv[])
{
    keyinfo::keyinfo_params_t params;
    bool                      json = false;
    bool                      full_fp = false;

    int opt = 0;
    while ((opt = getopt(argc, argv, "jfa:o:n:h")) != -1) {
        switch (opt) {
        case 'j':
            json = true;
            break;
        case 'f':
            full_fp = true;
            break;
        case 'a':
            params.autocrypt_addr = optarg;
            break;
        case 'o':
            params.autocrypt_origin = optarg;
            break;
        case 'n':
            if (!keyinfo::str_to_uint64(optarg, params.now)) {
                ERR_MSG(PFX "wrong reference time: %s", optarg);
                return 1;
            }
            break;
        case 'h':
            print_usage(argv[0]);
            return 0;
        default:
            print_usage(argv[0]);
            return 1;
        }
    }

    /* use the same reference time for all inputs */
    if (!params.now) {
        params.now = keyinfo_time_now();
    }

    try {
        if (optind >= argc) {
            std::vector<uint8_t> data;
            if (!keyinfo::read_stream(stdin, data, KEYINFO_CLI_INPUT_LIMIT)) {
                ERR_MSG(PFX "failed to read stdin: %s", strerror(errno));
                return 1;
            }
            return process_input("stdin", data, params, json, full_fp) ? 0 : 1;
        }

        int res = 0;
        for (int i = optind; i < argc; i++) {
            std::vector<uint8_t> data;
            if (!keyinfo::read_file(argv[i], data, KEYINFO_CLI_INPUT_LIMIT)) {
                ERR_MSG(PFX "failed to read %s: %s", argv[i], strerror(errno));
                res = 1;
                continue;
            }
            if (!process_input(argv[i], data, params, json, full_fp)) {
                res = 1;
            }
        }
        return res;
    } catch (const std::exception &e) {
        ERR_MSG(PFX "%s", e.what());
        return 1;
    }
}
