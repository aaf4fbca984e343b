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
#include <string.h>
#include <inttypes.h>
#include <algorithm>
#include "types.h"
#include "stream-packet.h"
#include "utils.h"
#include "crypto/ec.h"

int
get_packet_type(uint8_t ptag)
{
    if (!(ptag & PGP_PTAG_ALWAYS_SET)) {
        return -1;
    }

    if (ptag & PGP_PTAG_NEW_FORMAT) {
        return (int) (ptag & PGP_PTAG_NF_CONTENT_TAG_MASK);
    } else {
        return (int) ((ptag & PGP_PTAG_OF_CONTENT_TAG_MASK) >> PGP_PTAG_OF_CONTENT_TAG_SHIFT);
    }
}

bool
stream_pkt_hdr_len(pgp_source_t &src, size_t &hdrlen)
{
    uint8_t buf[2];

    if (!src_peek_eq(&src, buf, 2) || !(buf[0] & PGP_PTAG_ALWAYS_SET)) {
        return false;
    }

    if (buf[0] & PGP_PTAG_NEW_FORMAT) {
        if (buf[1] < 192) {
            hdrlen = 2;
        } else if (buf[1] < 224) {
            hdrlen = 3;
        } else if (buf[1] < 255) {
            hdrlen = 2;
        } else {
            hdrlen = 6;
        }
        return true;
    }

    switch (buf[0] & PGP_PTAG_OF_LENGTH_TYPE_MASK) {
    case PGP_PTAG_OLD_LEN_1:
        hdrlen = 2;
        return true;
    case PGP_PTAG_OLD_LEN_2:
        hdrlen = 3;
        return true;
    case PGP_PTAG_OLD_LEN_4:
        hdrlen = 5;
        return true;
    case PGP_PTAG_OLD_LEN_INDETERMINATE:
        hdrlen = 1;
        return true;
    default:
        return false;
    }
}

static bool
get_pkt_len(const uint8_t *hdr, size_t *pktlen)
{
    if (hdr[0] & PGP_PTAG_NEW_FORMAT) {
        // 1-byte length
        if (hdr[1] < 192) {
            *pktlen = hdr[1];
            return true;
        }
        // 2-byte length
        if (hdr[1] < 224) {
            *pktlen = ((size_t)(hdr[1] - 192) << 8) + (size_t) hdr[2] + 192;
            return true;
        }
        // 4-byte length
        if (hdr[1] == 255) {
            *pktlen = read_uint32(&hdr[2]);
            return true;
        }
        // partial length, we do not allow it here
        return false;
    }

    switch (hdr[0] & PGP_PTAG_OF_LENGTH_TYPE_MASK) {
    case PGP_PTAG_OLD_LEN_1:
        *pktlen = hdr[1];
        return true;
    case PGP_PTAG_OLD_LEN_2:
        *pktlen = read_uint16(&hdr[1]);
        return true;
    case PGP_PTAG_OLD_LEN_4:
        *pktlen = read_uint32(&hdr[1]);
        return true;
    default:
        return false;
    }
}

bool
stream_old_indeterminate_pkt_len(pgp_source_t *src)
{
    uint8_t ptag = 0;
    if (!src_peek_eq(src, &ptag, 1)) {
        return false;
    }
    return !(ptag & PGP_PTAG_NEW_FORMAT) &&
           ((ptag & PGP_PTAG_OF_LENGTH_TYPE_MASK) == PGP_PTAG_OLD_LEN_INDETERMINATE);
}

bool
stream_partial_pkt_len(pgp_source_t *src)
{
    uint8_t hdr[2] = {};
    if (!src_peek_eq(src, hdr, 2)) {
        return false;
    }
    return (hdr[0] & PGP_PTAG_NEW_FORMAT) && (hdr[1] >= 224) && (hdr[1] < 255);
}

size_t
get_partial_pkt_len(uint8_t blen)
{
    return 1 << (blen & 0x1f);
}

bool
stream_read_partial_chunk_len(pgp_source_t *src, size_t *clen, bool *last)
{
    uint8_t hdr[5] = {};

    if (!src_read_eq(src, hdr, 1)) {
        KEYINFO_LOG("failed to read header");
        return false;
    }

    *last = true;
    // partial length
    if ((hdr[0] >= 224) && (hdr[0] < 255)) {
        *last = false;
        *clen = get_partial_pkt_len(hdr[0]);
        return true;
    }
    // 1-byte length
    if (hdr[0] < 192) {
        *clen = hdr[0];
        return true;
    }
    // 2-byte length
    if (hdr[0] < 224) {
        if (!src_read_eq(src, &hdr[1], 1)) {
            KEYINFO_LOG("wrong 2-byte length");
            return false;
        }
        *clen = ((size_t)(hdr[0] - 192) << 8) + (size_t) hdr[1] + 192;
        return true;
    }
    // 4-byte length
    if (!src_read_eq(src, &hdr[1], 4)) {
        KEYINFO_LOG("wrong 4-byte length");
        return false;
    }
    *clen = read_uint32(&hdr[1]);
    return true;
}

keyinfo_result_t
stream_peek_packet_hdr(pgp_source_t *src, pgp_packet_hdr_t *hdr)
{
    size_t hlen = 0;
    memset(hdr, 0, sizeof(*hdr));
    if (!stream_pkt_hdr_len(*src, hlen)) {
        uint8_t hdr2[2] = {0};
        if (!src_peek_eq(src, hdr2, 2)) {
            KEYINFO_LOG("pkt header read failed at %zu", src_offset(src));
            return KEYINFO_ERROR_BAD_FORMAT;
        }
        KEYINFO_LOG("bad packet header: 0x%02x%02x at %zu", hdr2[0], hdr2[1], src_offset(src));
        return KEYINFO_ERROR_BAD_FORMAT;
    }

    if (!src_peek_eq(src, hdr->hdr, hlen)) {
        KEYINFO_LOG("failed to read pkt header at %zu", src_offset(src));
        return KEYINFO_ERROR_BAD_FORMAT;
    }

    hdr->hdr_len = hlen;
    hdr->tag = (pgp_pkt_type_t) get_packet_type(hdr->hdr[0]);

    if (stream_partial_pkt_len(src)) {
        hdr->partial = true;
    } else if (stream_old_indeterminate_pkt_len(src)) {
        hdr->indeterminate = true;
    } else {
        (void) get_pkt_len(hdr->hdr, &hdr->pkt_len);
    }

    return KEYINFO_SUCCESS;
}

keyinfo_result_t
stream_read_packets(pgp_source_t &src, std::vector<pgp_packet_body_t> &packets)
{
    while (!src_eof(&src)) {
        pgp_packet_body_t pkt;
        keyinfo_result_t  res = pkt.read(src);
        if (res) {
            return res;
        }
        packets.push_back(std::move(pkt));
    }
    return KEYINFO_SUCCESS;
}

bool
is_primary_key_pkt(int tag)
{
    return (tag == PGP_PKT_PUBLIC_KEY) || (tag == PGP_PKT_SECRET_KEY);
}

bool
is_public_key_pkt(int tag)
{
    switch (tag) {
    case PGP_PKT_PUBLIC_KEY:
    case PGP_PKT_PUBLIC_SUBKEY:
        return true;
    default:
        return false;
    }
}

bool
is_rsa_key_alg(pgp_pubkey_alg_t alg)
{
    switch (alg) {
    case PGP_PKA_RSA:
    case PGP_PKA_RSA_ENCRYPT_ONLY:
    case PGP_PKA_RSA_SIGN_ONLY:
        return true;
    default:
        return false;
    }
}

pgp_packet_body_t::pgp_packet_body_t(pgp_pkt_type_t tag) : tag_(tag), offset_(0), pos_(0)
{
}

pgp_pkt_type_t
pgp_packet_body_t::tag() const noexcept
{
    return tag_;
}

size_t
pgp_packet_body_t::offset() const noexcept
{
    return offset_;
}

const uint8_t *
pgp_packet_body_t::data() const noexcept
{
    return data_.data();
}

size_t
pgp_packet_body_t::size() const noexcept
{
    return data_.size();
}

size_t
pgp_packet_body_t::left() const noexcept
{
    return data_.size() - pos_;
}

const uint8_t *
pgp_packet_body_t::cur() const noexcept
{
    return data_.data() + pos_;
}

void
pgp_packet_body_t::skip(size_t len) noexcept
{
    pos_ += std::min(len, left());
}

void
pgp_packet_body_t::rewind() noexcept
{
    pos_ = 0;
}

bool
pgp_packet_body_t::get(uint8_t &val) noexcept
{
    if (pos_ >= data_.size()) {
        return false;
    }
    val = data_[pos_++];
    return true;
}

bool
pgp_packet_body_t::get(uint16_t &val) noexcept
{
    if (pos_ + 2 > data_.size()) {
        return false;
    }
    val = read_uint16(data_.data() + pos_);
    pos_ += 2;
    return true;
}

bool
pgp_packet_body_t::get(uint32_t &val) noexcept
{
    if (pos_ + 4 > data_.size()) {
        return false;
    }
    val = read_uint32(data_.data() + pos_);
    pos_ += 4;
    return true;
}

bool
pgp_packet_body_t::get(uint8_t *val, size_t len) noexcept
{
    if (len > left()) {
        return false;
    }
    memcpy(val, data_.data() + pos_, len);
    pos_ += len;
    return true;
}

bool
pgp_packet_body_t::get(std::vector<uint8_t> &val, size_t len)
{
    if (len > left()) {
        return false;
    }
    val.assign(data_.data() + pos_, data_.data() + pos_ + len);
    pos_ += len;
    return true;
}

bool
pgp_packet_body_t::get(pgp::mpi &val) noexcept
{
    uint16_t bits = 0;
    if (!get(bits)) {
        return false;
    }
    size_t len = (bits + 7) >> 3;
    if (len > PGP_MPINT_SIZE) {
        KEYINFO_LOG("too large mpi");
        return false;
    }
    if (!len) {
        KEYINFO_LOG("0 mpi");
        return false;
    }
    if (len > left()) {
        KEYINFO_LOG("failed to read mpi body");
        return false;
    }
    try {
        val.assign(cur(), len);
    } catch (const std::exception &e) {
        KEYINFO_LOG("%s", e.what());
        return false;
    }
    pos_ += len;
    /* check the mpi bit count */
    size_t mbits = val.bits();
    if (mbits != bits) {
        KEYINFO_LOG(
          "Warning! Wrong mpi bit count: got %" PRIu16 ", but actual is %zu", bits, mbits);
    }
    return true;
}

bool
pgp_packet_body_t::get(pgp_curve_t &val) noexcept
{
    uint8_t oidlen = 0;
    if (!get(oidlen)) {
        return false;
    }
    if (!oidlen || (oidlen == 0xff) || (oidlen > MAX_CURVE_OID_HEX_LEN)) {
        KEYINFO_LOG("unsupported curve oid len: %" PRIu8, oidlen);
        return false;
    }
    std::vector<uint8_t> oid;
    try {
        if (!get(oid, oidlen)) {
            return false;
        }
    } catch (const std::exception &e) {
        KEYINFO_LOG("%s", e.what());
        return false;
    }
    pgp_curve_t res = pgp::ec::Curve::by_OID(oid);
    if (res == PGP_CURVE_MAX) {
        KEYINFO_LOG("unsupported curve");
        return false;
    }
    val = res;
    return true;
}

void
pgp_packet_body_t::add(const void *data, size_t len)
{
    data_.insert(data_.end(), (const uint8_t *) data, (const uint8_t *) data + len);
}

keyinfo_result_t
pgp_packet_body_t::read(pgp_source_t &src) noexcept
{
    pgp_packet_hdr_t hdr = {};
    offset_ = src_offset(&src);

    keyinfo_result_t res = stream_peek_packet_hdr(&src, &hdr);
    if (res) {
        return res;
    }
    if ((tag_ != PGP_PKT_RESERVED) && (tag_ != hdr.tag)) {
        KEYINFO_LOG("tag mismatch: %d vs %d", (int) tag_, (int) hdr.tag);
        return KEYINFO_ERROR_BAD_FORMAT;
    }
    tag_ = hdr.tag;
    data_.clear();
    pos_ = 0;

    try {
        if (hdr.indeterminate) {
            /* packet lasts up to the end of the data */
            src_skip(&src, hdr.hdr_len);
            if (src_left(&src) > PGP_MAX_PKT_SIZE) {
                KEYINFO_LOG("too large packet at %zu", offset_);
                return KEYINFO_ERROR_BAD_FORMAT;
            }
            add(src.mem + src.pos, src_left(&src));
            src_skip(&src, src_left(&src));
            return KEYINFO_SUCCESS;
        }

        if (hdr.partial) {
            /* first chunk length is encoded in the header itself */
            src_skip(&src, 1);
            bool last = false;
            do {
                size_t clen = 0;
                if (!stream_read_partial_chunk_len(&src, &clen, &last)) {
                    return KEYINFO_ERROR_BAD_FORMAT;
                }
                if (data_.size() + clen > PGP_MAX_PKT_SIZE) {
                    KEYINFO_LOG("too large packet at %zu", offset_);
                    return KEYINFO_ERROR_BAD_FORMAT;
                }
                if (clen > src_left(&src)) {
                    KEYINFO_LOG("partial chunk of %zu bytes exceeds data at %zu",
                                clen,
                                src_offset(&src));
                    return KEYINFO_ERROR_BAD_FORMAT;
                }
                add(src.mem + src.pos, clen);
                src_skip(&src, clen);
            } while (!last);
            return KEYINFO_SUCCESS;
        }

        if (hdr.pkt_len > PGP_MAX_PKT_SIZE) {
            KEYINFO_LOG("too large packet at %zu", offset_);
            return KEYINFO_ERROR_BAD_FORMAT;
        }
        src_skip(&src, hdr.hdr_len);
        if (hdr.pkt_len > src_left(&src)) {
            KEYINFO_LOG("packet length %zu exceeds available %zu bytes at %zu",
                        hdr.pkt_len,
                        src_left(&src),
                        offset_);
            return KEYINFO_ERROR_BAD_FORMAT;
        }
        add(src.mem + src.pos, hdr.pkt_len);
        src_skip(&src, hdr.pkt_len);
    } catch (const std::exception &e) {
        KEYINFO_LOG("%s", e.what());
        return KEYINFO_ERROR_OUT_OF_MEMORY;
    }
    return KEYINFO_SUCCESS;
}
