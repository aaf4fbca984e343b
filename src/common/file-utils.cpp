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

#include "file-utils.h"
#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <errno.h>
#include <string.h>

bool
keyinfo_file_exists(const char *path)
{
    struct stat st;
    return keyinfo_stat(path, &st) == 0 && S_ISREG(st.st_mode);
}

FILE *
keyinfo_fopen(const char *filename, const char *mode)
{
    return fopen(filename, mode);
}

int
keyinfo_stat(const char *filename, struct stat *statbuf)
{
    return stat(filename, statbuf);
}

namespace keyinfo {

bool
read_stream(FILE *fp, std::vector<uint8_t> &data, size_t limit)
{
    uint8_t buf[4096];
    while (!feof(fp)) {
        size_t read = fread(buf, 1, sizeof(buf), fp);
        if (ferror(fp)) {
            return false;
        }
        if (data.size() + read > limit) {
            errno = EFBIG;
            return false;
        }
        data.insert(data.end(), buf, buf + read);
    }
    return true;
}

bool
read_file(const std::string &path, std::vector<uint8_t> &data, size_t limit)
{
    FILE *fp = keyinfo_fopen(path.c_str(), "rb");
    if (!fp) {
        return false;
    }
    bool res = read_stream(fp, data, limit);
    fclose(fp);
    return res;
}

namespace path {

std::string
append(const std::string &path, const std::string &name)
{
    if (path.empty()) {
        return name;
    }
    if (name.empty()) {
        return path;
    }
    bool path_sep = path.back() == separator();
    bool name_sep = name.front() == separator();
    if (path_sep && name_sep) {
        return path + name.substr(1);
    }
    if (path_sep || name_sep) {
        return path + name;
    }
    return path + separator() + name;
}

} // namespace path
} // namespace keyinfo
