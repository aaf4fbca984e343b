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

#ifndef KEYINFO_DEF_H_
#define KEYINFO_DEF_H_

#include <stdint.h>

/**
 * Function return type. 0 == SUCCESS, all other values are errors
 */
typedef uint32_t keyinfo_result_t;

enum {
    /* Error codes definitions */
    KEYINFO_SUCCESS = 0x00000000,

    /* Common error codes */
    KEYINFO_ERROR_GENERIC = 0x10000000,
    KEYINFO_ERROR_BAD_FORMAT,
    KEYINFO_ERROR_BAD_PARAMETERS,
    KEYINFO_ERROR_NOT_IMPLEMENTED,
    KEYINFO_ERROR_NOT_SUPPORTED,
    KEYINFO_ERROR_OUT_OF_MEMORY,
    KEYINFO_ERROR_SHORT_BUFFER,
    KEYINFO_ERROR_NULL_POINTER,

    /* Storage */
    KEYINFO_ERROR_ACCESS = 0x11000000,
    KEYINFO_ERROR_READ,
    KEYINFO_ERROR_WRITE,

    /* Internal state */
    KEYINFO_ERROR_BAD_STATE = 0x12000000,

    /* Parsing */
    KEYINFO_ERROR_NOT_ENOUGH_DATA = 0x13000000,
    KEYINFO_ERROR_UNKNOWN_TAG,
    KEYINFO_ERROR_PACKET_NOT_CONSUMED,
    KEYINFO_ERROR_NO_USERID,
    KEYINFO_ERROR_EOF,
};

/* Default origin label of the externally observed identity claim */
#define KEYINFO_AUTOCRYPT_ORIGIN "Autocrypt"

/* Default validity code: unknown/not evaluated */
#define KEYINFO_VALIDITY_UNKNOWN "?"
/* Validity code for expired keys */
#define KEYINFO_VALIDITY_EXPIRED "e"

/* Fingerprint value of the key which was never assigned one */
#define KEYINFO_FP_MISSING "MISSING"

/* Number of trailing fingerprint characters used in the short summary */
#define KEYINFO_SUMMARY_FP_LEN 16

#endif
