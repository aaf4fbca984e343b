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

#include <string.h>
#include "stream-common.h"

void
init_mem_src(pgp_source_t *src, const void *mem, size_t len)
{
    src->mem = (const uint8_t *) mem;
    src->size = mem ? len : 0;
    src->pos = 0;
}

bool
src_read(pgp_source_t *src, void *buf, size_t len, size_t *readres)
{
    if (!src_peek(src, buf, len, readres)) {
        return false;
    }
    src->pos += *readres;
    return true;
}

bool
src_read_eq(pgp_source_t *src, void *buf, size_t len)
{
    size_t res = 0;
    return src_read(src, buf, len, &res) && (res == len);
}

bool
src_peek(pgp_source_t *src, void *buf, size_t len, size_t *peeked)
{
    if (src->pos > src->size) {
        return false;
    }
    size_t left = src->size - src->pos;
    if (len > left) {
        len = left;
    }
    if (buf && len) {
        memcpy(buf, src->mem + src->pos, len);
    }
    *peeked = len;
    return true;
}

bool
src_peek_eq(pgp_source_t *src, void *buf, size_t len)
{
    size_t res = 0;
    return src_peek(src, buf, len, &res) && (res == len);
}

void
src_skip(pgp_source_t *src, size_t len)
{
    size_t left = src_left(src);
    src->pos += len > left ? left : len;
}

bool
src_eof(const pgp_source_t *src)
{
    return src->pos >= src->size;
}

size_t
src_left(const pgp_source_t *src)
{
    return src->pos < src->size ? src->size - src->pos : 0;
}

size_t
src_offset(const pgp_source_t *src)
{
    return src->pos;
}

bool
src_skip_eol(pgp_source_t *src)
{
    uint8_t eol[2];
    size_t  read;

    if (!src_peek(src, eol, 2, &read) || !read) {
        return false;
    }
    if (eol[0] == '\n') {
        src_skip(src, 1);
        return true;
    }
    if ((read == 2) && (eol[0] == '\r') && (eol[1] == '\n')) {
        src_skip(src, 2);
        return true;
    }
    return false;
}

bool
src_peek_line(pgp_source_t *src, char *buf, size_t len, size_t *readres)
{
    size_t left = src_left(src);
    if (!left || (len < 2)) {
        return false;
    }

    const char *line = (const char *) src->mem + src->pos;
    size_t      linelen = 0;
    while ((linelen < left) && (line[linelen] != '\n')) {
        linelen++;
    }
    /* strip trailing \r which is a part of CRLF sequence */
    size_t scpy = linelen;
    if ((linelen < left) && scpy && (line[scpy - 1] == '\r')) {
        scpy--;
    }
    if (scpy > len - 1) {
        memcpy(buf, line, len - 1);
        buf[len - 1] = '\0';
        *readres = len - 1;
        return false;
    }
    memcpy(buf, line, scpy);
    buf[scpy] = '\0';
    *readres = scpy;
    return true;
}
