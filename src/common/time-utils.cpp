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

/** Time utilities
 *  @file
 */

#include <stdint.h>
#include "time-utils.h"

static inline time_t
adjust_time32(time_t t)
{
    return (sizeof(t) == 4 && t < 0) ? INT32_MAX : t;
}

uint64_t
keyinfo_time_now()
{
    time_t now = adjust_time32(time(NULL));
    return now < 0 ? 0 : (uint64_t) now;
}

void
keyinfo_gmtime(time_t t, struct tm &tm)
{
    time_t adjusted = adjust_time32(t);
#ifndef _WIN32
    gmtime_r(&adjusted, &tm);
#else
    (void) gmtime_s(&tm, &adjusted);
#endif
}

std::string
keyinfo_strtime(uint64_t t)
{
    struct tm tm = {};
    keyinfo_gmtime((time_t) t, tm);
    char buf[32] = {0};
    if (!strftime(buf, sizeof(buf), "%Y-%m-%d", &tm)) {
        return std::string();
    }
    return std::string(buf);
}
