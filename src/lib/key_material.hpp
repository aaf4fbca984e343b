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

#ifndef KEYINFO_KEY_MATERIAL_HPP_
#define KEYINFO_KEY_MATERIAL_HPP_

#include <memory>
#include "types.h"
#include "crypto/mpi.hpp"

typedef struct pgp_packet_body_t pgp_packet_body_t;

namespace pgp {

/* Public key material. Secret parts are never parsed. */
class KeyMaterial {
  protected:
    pgp_pubkey_alg_t alg_; /* algorithm of the key */

  public:
    KeyMaterial(pgp_pubkey_alg_t kalg = PGP_PKA_NOTHING) : alg_(kalg){};
    virtual ~KeyMaterial();

    pgp_pubkey_alg_t    alg() const noexcept;
    virtual bool        parse(pgp_packet_body_t &pkt) noexcept = 0;
    virtual size_t      bits() const noexcept = 0;
    virtual pgp_curve_t curve() const noexcept;

    /* @return material object for the algorithm, or nullptr if algorithm is unknown */
    static std::unique_ptr<KeyMaterial> create(pgp_pubkey_alg_t alg);
};

class RSAKeyMaterial : public KeyMaterial {
  protected:
    mpi n_;
    mpi e_;

  public:
    RSAKeyMaterial(pgp_pubkey_alg_t kalg) : KeyMaterial(kalg){};

    bool   parse(pgp_packet_body_t &pkt) noexcept override;
    size_t bits() const noexcept override;

    const mpi &n() const noexcept;
    const mpi &e() const noexcept;
};

class DSAKeyMaterial : public KeyMaterial {
  protected:
    mpi p_;
    mpi q_;
    mpi g_;
    mpi y_;

  public:
    DSAKeyMaterial() : KeyMaterial(PGP_PKA_DSA){};

    bool   parse(pgp_packet_body_t &pkt) noexcept override;
    size_t bits() const noexcept override;
    size_t qbits() const noexcept;

    const mpi &p() const noexcept;
    const mpi &q() const noexcept;
    const mpi &g() const noexcept;
    const mpi &y() const noexcept;
};

class EGKeyMaterial : public KeyMaterial {
  protected:
    mpi p_;
    mpi g_;
    mpi y_;

  public:
    EGKeyMaterial(pgp_pubkey_alg_t kalg) : KeyMaterial(kalg){};

    bool   parse(pgp_packet_body_t &pkt) noexcept override;
    size_t bits() const noexcept override;

    const mpi &p() const noexcept;
    const mpi &g() const noexcept;
    const mpi &y() const noexcept;
};

/* ECDSA, EdDSA and SM2 keys: curve and public point */
class ECKeyMaterial : public KeyMaterial {
  protected:
    pgp_curve_t curve_;
    mpi         p_;

  public:
    ECKeyMaterial(pgp_pubkey_alg_t kalg) : KeyMaterial(kalg), curve_(PGP_CURVE_UNKNOWN){};

    bool        parse(pgp_packet_body_t &pkt) noexcept override;
    size_t      bits() const noexcept override;
    pgp_curve_t curve() const noexcept override;

    const mpi &p() const noexcept;
};

class ECDHKeyMaterial : public ECKeyMaterial {
    pgp_hash_alg_t kdf_hash_alg_; /* Hash used by kdf */
    uint8_t        key_wrap_alg_; /* Symmetric algorithm used to wrap KEK*/

  public:
    ECDHKeyMaterial()
        : ECKeyMaterial(PGP_PKA_ECDH), kdf_hash_alg_(PGP_HASH_UNKNOWN), key_wrap_alg_(0){};

    bool parse(pgp_packet_body_t &pkt) noexcept override;

    pgp_hash_alg_t kdf_hash_alg() const noexcept;
    uint8_t        key_wrap_alg() const noexcept;
};

} // namespace pgp

#endif // KEYINFO_KEY_MATERIAL_HPP_
