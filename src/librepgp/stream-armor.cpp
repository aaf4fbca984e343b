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

#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <string>
#include <algorithm>
#include "stream-armor.h"
#include "str-utils.h"
#include "crypto/hash.hpp"
#include "utils.h"

#define ARMORED_PEEK_BUF_SIZE 1024

#define ST_DASHES "-----"
#define ST_ARMOR_BEGIN "-----BEGIN "
#define ST_ARMOR_END "-----END "
#define CH_DASH '-'
#define CH_EQ '='

/*
   Table for base64 lookups:
   0xff - wrong character,
   0xfe - '='
   0xfd - eol/whitespace,
   0..0x3f - represented 6-bit number
*/
static const uint8_t B64DEC[256] = {
  0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xfd, 0xfd, 0xff, 0xff, 0xfd, 0xff,
  0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
  0xff, 0xff, 0xfd, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x3e, 0xff,
  0xff, 0xff, 0x3f, 0x34, 0x35, 0x36, 0x37, 0x38, 0x39, 0x3a, 0x3b, 0x3c, 0x3d, 0xff, 0xff,
  0xff, 0xfe, 0xff, 0xff, 0xff, 0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09,
  0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f, 0x10, 0x11, 0x12, 0x13, 0x14, 0x15, 0x16, 0x17, 0x18,
  0x19, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x1a, 0x1b, 0x1c, 0x1d, 0x1e, 0x1f, 0x20, 0x21,
  0x22, 0x23, 0x24, 0x25, 0x26, 0x27, 0x28, 0x29, 0x2a, 0x2b, 0x2c, 0x2d, 0x2e, 0x2f, 0x30,
  0x31, 0x32, 0x33, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
  0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
  0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
  0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
  0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
  0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
  0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
  0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
  0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
  0xff};

typedef struct pgp_armor_block_t {
    pgp_armored_msg_t    type;     /* type of the message */
    std::string          armorhdr; /* armor header, i.e. "BEGIN PGP PUBLIC KEY BLOCK" */
    std::vector<uint8_t> b64;      /* decoded 6-bit values */
    size_t               eqcount;  /* number of '=' padding characters */
    uint8_t              readcrc[3];
    bool                 has_crc;
} pgp_armor_block_t;

/** @brief finds armor header position in the buffer, returning beginning of header or NULL.
 *  hdrlen will contain the length of the header
 **/
static const char *
find_armor_header(const char *buf, size_t len, size_t *hdrlen)
{
    static const size_t stlen = strlen(ST_ARMOR_BEGIN);
    const char *        end = buf + len;
    const char *        st = NULL;

    for (const char *ptr = buf; ptr + stlen <= end; ptr++) {
        if ((*ptr == CH_DASH) && !strncmp(ptr, ST_ARMOR_BEGIN, stlen)) {
            st = ptr;
            break;
        }
    }
    if (!st) {
        return NULL;
    }

    for (const char *ptr = st + 5; ptr + 5 <= end; ptr++) {
        if ((*ptr == '\n') || (*ptr == '\r')) {
            break;
        }
        if ((*ptr == CH_DASH) && !strncmp(ptr, ST_DASHES, 5)) {
            *hdrlen = ptr + 5 - st;
            return st;
        }
    }
    /* header without the trailing dashes */
    *hdrlen = 0;
    return st;
}

static bool
str_equals(const char *str, size_t len, const char *another)
{
    size_t alen = strlen(another);
    return (len == alen) && !memcmp(str, another, alen);
}

pgp_armored_msg_t
armor_str_to_data_type(const char *str, size_t len)
{
    if (!str) {
        return PGP_ARMORED_UNKNOWN;
    }
    if (str_equals(str, len, "BEGIN PGP MESSAGE")) {
        return PGP_ARMORED_MESSAGE;
    }
    if (str_equals(str, len, "BEGIN PGP PUBLIC KEY BLOCK") ||
        str_equals(str, len, "BEGIN PGP PUBLIC KEY")) {
        return PGP_ARMORED_PUBLIC_KEY;
    }
    if (str_equals(str, len, "BEGIN PGP SECRET KEY BLOCK") ||
        str_equals(str, len, "BEGIN PGP SECRET KEY") ||
        str_equals(str, len, "BEGIN PGP PRIVATE KEY BLOCK") ||
        str_equals(str, len, "BEGIN PGP PRIVATE KEY")) {
        return PGP_ARMORED_SECRET_KEY;
    }
    if (str_equals(str, len, "BEGIN PGP SIGNATURE")) {
        return PGP_ARMORED_SIGNATURE;
    }
    if (str_equals(str, len, "BEGIN PGP SIGNED MESSAGE")) {
        return PGP_ARMORED_CLEARTEXT;
    }
    return PGP_ARMORED_UNKNOWN;
}

bool
is_armored_source(pgp_source_t *src)
{
    size_t hdrlen = 0;
    return find_armor_header((const char *) src->mem + src->pos, src_left(src), &hdrlen);
}

static bool
armor_skip_chars(pgp_source_t *src, const char *chars)
{
    uint8_t ch;

    while (src_peek_eq(src, &ch, 1)) {
        if (!strchr(chars, ch)) {
            break;
        }
        src_skip(src, 1);
    }
    return true;
}

/* @return false if there is no more armor headers in the source */
static bool
armor_find_header(pgp_source_t *src, pgp_armor_block_t &block)
{
    const char *hdr = (const char *) src->mem + src->pos;
    size_t      hdrlen = 0;
    const char *armhdr = find_armor_header(hdr, src_left(src), &hdrlen);
    if (!armhdr) {
        return false;
    }

    if (hdrlen < 10) {
        KEYINFO_LOG("malformed armor header at %zu", src_offset(src) + (armhdr - hdr));
        block.type = PGP_ARMORED_UNKNOWN;
        return true;
    }
    /* if there are non-whitespaces before the armor header then issue warning */
    for (const char *ch = hdr; ch < armhdr; ch++) {
        if (B64DEC[(uint8_t) *ch] != 0xfd) {
            KEYINFO_LOG("extra data before the header line");
            break;
        }
    }

    block.armorhdr.assign(armhdr + 5, hdrlen - 10);
    block.type = armor_str_to_data_type(armhdr + 5, hdrlen - 10);
    src_skip(src, armhdr - hdr + hdrlen);
    armor_skip_chars(src, "\t ");
    return true;
}

static bool
is_base64_line(const char *line, size_t len)
{
    for (size_t i = 0; i < len && line[i]; i++) {
        if (B64DEC[(uint8_t) line[i]] == 0xff)
            return false;
    }
    return true;
}

static bool
armor_parse_headers(pgp_source_t *src)
{
    char header[ARMORED_PEEK_BUF_SIZE] = {0};

    if (!src_skip_eol(src)) {
        KEYINFO_LOG("no eol after the armor header line");
        return false;
    }

    do {
        size_t hdrlen = 0;
        if (!src_peek_line(src, header, sizeof(header), &hdrlen)) {
            if (src_eof(src)) {
                KEYINFO_LOG("unexpected end of data in armor headers");
                return false;
            }
            /* too long line, cannot be base64 data */
            KEYINFO_LOG("Too long armor header - skipped.");
            while (!src_eof(src) && !src_skip_eol(src)) {
                src_skip(src, 1);
            }
            continue;
        }
        if (keyinfo::is_blank_line(header, hdrlen)) {
            /* empty line - end of the headers */
            src_skip(src, hdrlen);
            return src_skip_eol(src) || src_eof(src);
        }
        if (is_base64_line(header, hdrlen)) {
            KEYINFO_LOG("Warning: no empty line after the base64 headers");
            return true;
        }
        if (!strchr(header, ':')) {
            KEYINFO_LOG("wrong armor header '%s'", header);
            return false;
        }
        src_skip(src, hdrlen);
        if (!src_skip_eol(src)) {
            KEYINFO_LOG("unexpected end of data in armor headers");
            return false;
        }
    } while (1);
}

static bool
armor_read_crc(const char *line, size_t len, pgp_armor_block_t &block)
{
    uint8_t dec[4] = {0};

    if ((len < 5) || (line[0] != CH_EQ)) {
        return false;
    }
    for (int i = 0; i < 4; i++) {
        if ((dec[i] = B64DEC[(uint8_t) line[i + 1]]) >= 64) {
            return false;
        }
    }
    if (!keyinfo::is_blank_line(line + 5, len - 5)) {
        return false;
    }

    block.readcrc[0] = (dec[0] << 2) | ((dec[1] >> 4) & 0x0F);
    block.readcrc[1] = (dec[1] << 4) | ((dec[2] >> 2) & 0x0F);
    block.readcrc[2] = (dec[2] << 6) | dec[3];
    block.has_crc = true;
    return true;
}

static bool
armor_read_trailer(pgp_source_t *src, const pgp_armor_block_t &block)
{
    char line[ARMORED_PEEK_BUF_SIZE] = {0};
    /* Space or tab could get between armor and trailer */
    armor_skip_chars(src, "\r\n \t");

    size_t len = 0;
    if (!src_peek_line(src, line, sizeof(line), &len)) {
        return false;
    }
    std::string trailer = ST_ARMOR_END + block.armorhdr.substr(6) + ST_DASHES;
    if ((len < trailer.size()) || strncmp(line, trailer.c_str(), trailer.size()) ||
        !keyinfo::is_blank_line(line + trailer.size(), len - trailer.size())) {
        return false;
    }
    src_skip(src, len);
    (void) src_skip_eol(src);
    return true;
}

/* read base64 lines, up to the CRC or the armor trailer line */
static bool
armor_read_base64(pgp_source_t *src, pgp_armor_block_t &block)
{
    char line[ARMORED_PEEK_BUF_SIZE] = {0};
    bool padding = false;

    while (true) {
        size_t len = 0;
        if (!src_peek_line(src, line, sizeof(line), &len)) {
            if (src_eof(src)) {
                KEYINFO_LOG("premature end of armored input");
            } else {
                KEYINFO_LOG("too long base64 line at %zu", src_offset(src));
            }
            return false;
        }
        if ((len >= 5) && !strncmp(line, ST_DASHES, 5)) {
            /* armor trailer without the CRC */
            return true;
        }
        if (line[0] == CH_EQ) {
            if (armor_read_crc(line, len, block)) {
                src_skip(src, len);
                (void) src_skip_eol(src);
                return true;
            }
            if (!padding && block.b64.size() % 4 == 0) {
                KEYINFO_LOG("Warning: malformed CRC line");
                src_skip(src, len);
                (void) src_skip_eol(src);
                return true;
            }
        }

        for (size_t i = 0; i < len; i++) {
            uint8_t bval = B64DEC[(uint8_t) line[i]];
            if (bval < 64) {
                if (padding) {
                    KEYINFO_LOG("base64 data after the padding");
                    return false;
                }
                block.b64.push_back(bval);
                continue;
            }
            if (bval == 0xfe) {
                padding = true;
                block.eqcount++;
                continue;
            }
            if (bval == 0xff) {
                KEYINFO_LOG("wrong base64 character 0x%02hhX", (unsigned char) line[i]);
                return false;
            }
        }
        if (block.eqcount > 2) {
            KEYINFO_LOG("wrong base64 padding length %zu.", block.eqcount);
            return false;
        }
        src_skip(src, len);
        if (!src_skip_eol(src)) {
            KEYINFO_LOG("premature end of armored input");
            return false;
        }
    }
}

static bool
armor_decode_block(const pgp_armor_block_t &block, std::vector<uint8_t> &dst)
{
    const std::vector<uint8_t> &b64 = block.b64;
    if ((b64.size() + block.eqcount) % 4 != 0) {
        KEYINFO_LOG("wrong b64 padding");
        return false;
    }

    size_t start = dst.size();
    size_t full = b64.size() / 4 * 4;
    for (size_t i = 0; i < full; i += 4) {
        uint32_t b24 = (b64[i] << 18) | (b64[i + 1] << 12) | (b64[i + 2] << 6) | b64[i + 3];
        dst.push_back(b24 >> 16);
        dst.push_back((b24 >> 8) & 0xff);
        dst.push_back(b24 & 0xff);
    }
    if (block.eqcount == 1) {
        uint32_t b24 = (b64[full] << 10) | (b64[full + 1] << 4) | (b64[full + 2] >> 2);
        dst.push_back(b24 >> 8);
        dst.push_back(b24 & 0xff);
    } else if (block.eqcount == 2) {
        dst.push_back((b64[full] << 2) | (b64[full + 1] >> 4));
    }

    if (!block.has_crc) {
        return true;
    }
    auto crc_ctx = keyinfo::CRC24::create();
    crc_ctx->add(dst.data() + start, dst.size() - start);
    auto crc = crc_ctx->finish();
    if (memcmp(block.readcrc, crc.data(), 3)) {
        KEYINFO_LOG("Warning: CRC mismatch");
    }
    return true;
}

keyinfo_result_t
dearmor_source(pgp_source_t &src, std::vector<uint8_t> &dst)
{
    size_t blocks = 0;

    try {
        while (!src_eof(&src)) {
            pgp_armor_block_t block = {};
            if (!armor_find_header(&src, block)) {
                break;
            }
            if (block.type == PGP_ARMORED_UNKNOWN) {
                KEYINFO_LOG("unknown armor header at %zu", src_offset(&src));
                return KEYINFO_ERROR_BAD_FORMAT;
            }
            if (block.type == PGP_ARMORED_CLEARTEXT) {
                /* signed text goes before the signature armor block */
                KEYINFO_LOG("skipping cleartext signed data");
                continue;
            }
            if (!armor_parse_headers(&src) || !armor_read_base64(&src, block)) {
                return KEYINFO_ERROR_BAD_FORMAT;
            }
            if (!armor_read_trailer(&src, block)) {
                KEYINFO_LOG("wrong armor trailer at %zu", src_offset(&src));
                return KEYINFO_ERROR_BAD_FORMAT;
            }
            if (!armor_decode_block(block, dst)) {
                return KEYINFO_ERROR_BAD_FORMAT;
            }
            blocks++;
        }
    } catch (const std::exception &e) {
        KEYINFO_LOG("%s", e.what());
        return KEYINFO_ERROR_BAD_STATE;
    }

    if (!blocks) {
        KEYINFO_LOG("no armor header");
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    return KEYINFO_SUCCESS;
}
