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

#ifndef EC_H_
#define EC_H_

#include <cstddef>
#include <cstdint>
#include <repgp/repgp_def.h>
#include <vector>

namespace pgp {
namespace ec {
/**
 * Structure holds description of elliptic curve
 */
class Curve {
  public:
    const pgp_curve_t          curve_id;
    const size_t               bitlen;
    const std::vector<uint8_t> OID;

    /**
     * @brief   Finds curve ID by OID bytes
     * @param   oid       buffer with OID bytes
     * @returns success curve ID
     *          failure PGP_CURVE_MAX is returned
     * @remarks see RFC 4880 bis 01 - 9.2 ECC Curve OID
     */
    static pgp_curve_t by_OID(const std::vector<uint8_t> &oid);

    /**
     * @brief   Returns pointer to the curve descriptor
     *
     * @param   Valid curve ID
     *
     * @returns NULL if wrong ID provided, otherwise descriptor
     *
     */
    static const Curve *get(const pgp_curve_t curve_id);
};

} // namespace ec
} // namespace pgp

#endif
