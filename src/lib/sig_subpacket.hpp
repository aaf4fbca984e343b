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

#ifndef KEYINFO_SIG_SUBPACKET_HPP_
#define KEYINFO_SIG_SUBPACKET_HPP_

#include <cstdint>
#include <vector>
#include <string>
#include <memory>
#include "repgp/repgp_def.h"
#include "types.h"

/**
 * @brief Signature subpacket classes.
 */
namespace pgp {

namespace pkt {

namespace sigsub {

enum class Type : uint8_t {
    Unknown = 0,
    CreationTime = 2,        /* signature creation time */
    ExpirationTime = 3,      /* signature expiration time */
    KeyExpirationTime = 9,   /* key expiration time */
    IssuerKeyID = 16,        /* issuer key ID */
    PrimaryUserID = 25,      /* primary user ID */
    KeyFlags = 27,           /* key flags */
    IssuerFingerprint = 33,  /* issuer fingerprint */
};

/* Raw unparsed signature subpacket */
class Raw;
using RawPtr = std::unique_ptr<Raw>;

class Raw {
  private:
    bool    hashed_;
    uint8_t raw_type_;
    bool    critical_;

  protected:
    Type                 type_;
    std::vector<uint8_t> data_;

    virtual bool check_size(size_t size) const noexcept;
    virtual bool parse_data(const uint8_t *data, size_t size);

  public:
    Raw(uint8_t rawtype, bool hashed, bool critical);
    Raw(Type type, bool hashed, bool critical);
    virtual ~Raw();

    uint8_t
    raw_type() const noexcept
    {
        return raw_type_;
    }

    const std::vector<uint8_t> &
    data() const noexcept
    {
        return data_;
    }

    Type
    type() const noexcept
    {
        return type_;
    }

    bool
    critical() const noexcept
    {
        return critical_;
    }

    bool
    hashed() const noexcept
    {
        return hashed_;
    }

    virtual bool parse(const uint8_t *data, size_t size);

    static RawPtr create(uint8_t type, bool hashed = true, bool critical = false);

    static RawPtr create(Type type, bool hashed = true, bool critical = false);

    /**
     * @brief Create subpacket from its body (type octet and data).
     *        If data of the known subpacket type is malformed then untyped Raw subpacket is
     *        returned, keeping the raw type and data.
     * @return subpacket or nullptr if size is 0.
     */
    static RawPtr create(const uint8_t *data, size_t size, bool hashed);
};

/* Base class for timestamp-based subpackets */
class Time : public Raw {
  private:
    uint32_t time_;

  protected:
    bool check_size(size_t size) const noexcept override;
    bool parse_data(const uint8_t *data, size_t size) override;

  public:
    Time(Type type, bool hashed, bool critical) : Raw(type, hashed, critical), time_(0)
    {
    }

    uint32_t
    time() const noexcept
    {
        return time_;
    }
};

/* Creation time signature subpacket */
class CreationTime : public Time {
  public:
    CreationTime(bool hashed = true, bool critical = false)
        : Time(Type::CreationTime, hashed, critical)
    {
    }
};

/* Signature expiration time signature subpacket */
class ExpirationTime : public Time {
  public:
    ExpirationTime(bool hashed = true, bool critical = false)
        : Time(Type::ExpirationTime, hashed, critical)
    {
    }
};

/* Key expiration time signature subpacket */
class KeyExpirationTime : public Time {
  public:
    KeyExpirationTime(bool hashed = true, bool critical = false)
        : Time(Type::KeyExpirationTime, hashed, critical)
    {
    }
};

/* Base class for subpackets with single flags octet */
class Flags : public Raw {
  protected:
    uint8_t flags_;

    bool check_size(size_t size) const noexcept override;
    bool parse_data(const uint8_t *data, size_t size) override;

  public:
    Flags(Type type, bool hashed = true, bool critical = false)
        : Raw(type, hashed, critical), flags_(0)
    {
    }
};

/* Key flags signature subpacket */
class KeyFlags : public Flags {
  public:
    KeyFlags(bool hashed = true, bool critical = false)
        : Flags(Type::KeyFlags, hashed, critical)
    {
    }

    uint8_t
    flags() const noexcept
    {
        return flags_;
    }
};

class List {
  public:
    std::vector<RawPtr> items;

    List()
    {
    }
    List(const List &src) = delete;
    List(List &&src) = default;
    List &operator=(List &&src) = default;

    std::vector<RawPtr>::const_iterator
    begin() const
    {
        return items.begin();
    }

    std::vector<RawPtr>::const_iterator
    end() const
    {
        return items.end();
    }

    size_t
    size() const
    {
        return items.size();
    }

    /* number of subpackets in hashed or unhashed area */
    size_t count(bool hashed) const;
};

} // namespace sigsub
} // namespace pkt
} // namespace pgp

#endif
