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

#include "key_material.hpp"
#include <librepgp/stream-packet.h>
#include "crypto/ec.h"
#include "logging.h"

namespace pgp {

KeyMaterial::~KeyMaterial()
{
}

pgp_pubkey_alg_t
KeyMaterial::alg() const noexcept
{
    return alg_;
}

pgp_curve_t
KeyMaterial::curve() const noexcept
{
    return PGP_CURVE_UNKNOWN;
}

std::unique_ptr<KeyMaterial>
KeyMaterial::create(pgp_pubkey_alg_t alg)
{
    switch (alg) {
    case PGP_PKA_RSA:
    case PGP_PKA_RSA_ENCRYPT_ONLY:
    case PGP_PKA_RSA_SIGN_ONLY:
        return std::unique_ptr<KeyMaterial>(new RSAKeyMaterial(alg));
    case PGP_PKA_ELGAMAL:
    case PGP_PKA_ELGAMAL_ENCRYPT_OR_SIGN:
        return std::unique_ptr<KeyMaterial>(new EGKeyMaterial(alg));
    case PGP_PKA_DSA:
        return std::unique_ptr<KeyMaterial>(new DSAKeyMaterial());
    case PGP_PKA_ECDH:
        return std::unique_ptr<KeyMaterial>(new ECDHKeyMaterial());
    case PGP_PKA_ECDSA:
    case PGP_PKA_EDDSA:
    case PGP_PKA_SM2:
        return std::unique_ptr<KeyMaterial>(new ECKeyMaterial(alg));
    default:
        KEYINFO_LOG("unknown pk alg %d", alg);
        return nullptr;
    }
}

bool
RSAKeyMaterial::parse(pgp_packet_body_t &pkt) noexcept
{
    return pkt.get(n_) && pkt.get(e_);
}

size_t
RSAKeyMaterial::bits() const noexcept
{
    return n_.bits();
}

const mpi &
RSAKeyMaterial::n() const noexcept
{
    return n_;
}

const mpi &
RSAKeyMaterial::e() const noexcept
{
    return e_;
}

bool
DSAKeyMaterial::parse(pgp_packet_body_t &pkt) noexcept
{
    return pkt.get(p_) && pkt.get(q_) && pkt.get(g_) && pkt.get(y_);
}

size_t
DSAKeyMaterial::bits() const noexcept
{
    return p_.bits();
}

size_t
DSAKeyMaterial::qbits() const noexcept
{
    return q_.bits();
}

const mpi &
DSAKeyMaterial::p() const noexcept
{
    return p_;
}

const mpi &
DSAKeyMaterial::q() const noexcept
{
    return q_;
}

const mpi &
DSAKeyMaterial::g() const noexcept
{
    return g_;
}

const mpi &
DSAKeyMaterial::y() const noexcept
{
    return y_;
}

bool
EGKeyMaterial::parse(pgp_packet_body_t &pkt) noexcept
{
    return pkt.get(p_) && pkt.get(g_) && pkt.get(y_);
}

size_t
EGKeyMaterial::bits() const noexcept
{
    return p_.bits();
}

const mpi &
EGKeyMaterial::p() const noexcept
{
    return p_;
}

const mpi &
EGKeyMaterial::g() const noexcept
{
    return g_;
}

const mpi &
EGKeyMaterial::y() const noexcept
{
    return y_;
}

bool
ECKeyMaterial::parse(pgp_packet_body_t &pkt) noexcept
{
    return pkt.get(curve_) && pkt.get(p_);
}

size_t
ECKeyMaterial::bits() const noexcept
{
    auto curve = ec::Curve::get(curve_);
    return curve ? curve->bitlen : 0;
}

pgp_curve_t
ECKeyMaterial::curve() const noexcept
{
    return curve_;
}

const mpi &
ECKeyMaterial::p() const noexcept
{
    return p_;
}

bool
ECDHKeyMaterial::parse(pgp_packet_body_t &pkt) noexcept
{
    if (!ECKeyMaterial::parse(pkt)) {
        return false;
    }
    /* Additional ECDH fields */
    /* Read KDF parameters. At the moment should be 0x03 0x01 halg ealg */
    uint8_t len = 0, halg = 0, walg = 0;
    if (!pkt.get(len) || (len != 3)) {
        return false;
    }
    if (!pkt.get(len) || (len != 1)) {
        return false;
    }
    if (!pkt.get(halg) || !pkt.get(walg)) {
        return false;
    }
    kdf_hash_alg_ = (pgp_hash_alg_t) halg;
    key_wrap_alg_ = walg;
    return true;
}

pgp_hash_alg_t
ECDHKeyMaterial::kdf_hash_alg() const noexcept
{
    return kdf_hash_alg_;
}

uint8_t
ECDHKeyMaterial::key_wrap_alg() const noexcept
{
    return key_wrap_alg_;
}

} // namespace pgp
