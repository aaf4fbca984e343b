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

#ifndef KEYINFO_FILE_UTILS_H_
#define KEYINFO_FILE_UTILS_H_

#include <stdint.h>
#include <stdio.h>
#include <string>
#include <vector>

bool  keyinfo_file_exists(const char *path);
FILE *keyinfo_fopen(const char *filename, const char *mode);
int   keyinfo_stat(const char *filename, struct stat *statbuf);

namespace keyinfo {
/**
 * @brief Read the whole stream contents.
 *
 * @param fp opened stream, i.e. file or stdin
 * @param data contents will be appended here
 * @param limit maximum number of bytes to read
 * @return true on success or false if read failed or limit was exceeded.
 */
bool read_stream(FILE *fp, std::vector<uint8_t> &data, size_t limit);

/**
 * @brief Read the whole file contents.
 * @return true on success or false otherwise.
 */
bool read_file(const std::string &path, std::vector<uint8_t> &data, size_t limit);

namespace path {
inline char
separator()
{
    return '/';
}

/**
 * @brief Append path component(s) to the base path, inserting separator between them.
 */
std::string append(const std::string &path, const std::string &name);
} // namespace path
} // namespace keyinfo

#endif
