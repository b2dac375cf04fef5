/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmmeta/ebml_reader.h"

#include <cstring>

#include "internal_logger.h"
#include "lmcore/byte_order.h"

namespace lmshao::lmmeta {

// EBML varint width detection: leading 1 bit mask across first byte
static inline int DetectVintWidth(uint8_t first)
{
    for (int i = 0; i < 8; ++i) {
        if (first & (0x80 >> i)) {
            return i + 1; // width in bytes
        }
    }
    return -1; // invalid
}

static inline void SetError(EbmlError *err, EbmlStatus status, size_t offset, size_t needed)
{
    if (err) {
        err->status = status;
        err->offset = offset;
        err->needed = needed;
    }
}

size_t ReadVint(BufferCursor &cur, VintMode mode, uint64_t &value, EbmlError *err)
{
    size_t start = cur.Tell();
    uint8_t b0 = 0;
    if (cur.Read(&b0, 1) != 1) {
        SetError(err, EbmlStatus::kEndOfBuffer, start, 1);
        return 0;
    }
    int width = DetectVintWidth(b0);
    if (width <= 0) {
        LMMETA_LOGE("Invalid EBML %s leading byte 0x%02X at offset %zu", mode == VintMode::kId ? "ID" : "size", b0,
                    start);
        SetError(err, EbmlStatus::kInvalidVint, start, 1);
        return 0;
    }
    if (mode == VintMode::kId && static_cast<size_t>(width) > kMaxEbmlIdWidth) {
        LMMETA_LOGE("EBML ID width %d exceeds %zu bytes at offset %zu", width, kMaxEbmlIdWidth, start);
        SetError(err, EbmlStatus::kInvalidVint, start, static_cast<size_t>(width));
        return 0;
    }

    uint64_t v = (mode == VintMode::kId) ? b0 : static_cast<uint64_t>(b0 & (0xFF >> width));
    uint8_t rest[7] = {0};
    size_t need = static_cast<size_t>(width - 1);
    size_t got = cur.Read(rest, need);
    if (got != need) {
        LMMETA_LOGE("Truncated EBML varint: need %zu more bytes, got %zu", need, got);
        SetError(err, EbmlStatus::kEndOfBuffer, start, static_cast<size_t>(width));
        return 0;
    }
    for (size_t i = 0; i < need; ++i) {
        v = (v << 8) | rest[i];
    }
    value = v;
    SetError(err, EbmlStatus::kOk, start, static_cast<size_t>(width));
    return static_cast<size_t>(width);
}

size_t ReadVintId(BufferCursor &cur, uint64_t &value, EbmlError *err)
{
    return ReadVint(cur, VintMode::kId, value, err);
}

size_t ReadVintSize(BufferCursor &cur, uint64_t &value, EbmlError *err)
{
    return ReadVint(cur, VintMode::kSize, value, err);
}

bool NextElement(BufferCursor &cur, EbmlElementHeader &out, EbmlError *err)
{
    uint64_t id = 0;
    if (ReadVintId(cur, id, err) == 0) {
        return false;
    }
    uint64_t size = 0;
    if (ReadVintSize(cur, size, err) == 0) {
        return false;
    }
    out.id = id;
    out.size = size;
    return true;
}

bool SkipBytes(BufferCursor &cur, uint64_t size)
{
    if (size > cur.Remaining()) {
        LMMETA_LOGE("Cannot skip %llu bytes at offset %zu, only %zu left", (unsigned long long)size, cur.Tell(),
                    cur.Remaining());
        return false;
    }
    return cur.Seek(cur.Tell() + size);
}

uint64_t ReadUnsignedBE(const uint8_t *p, size_t size)
{
    uint64_t v = 0;
    for (size_t i = 0; i < size && i < 8; ++i) {
        v = (v << 8) | p[i];
    }
    return v;
}

double ReadFloatBE(const uint8_t *p, size_t size)
{
    using lmshao::lmcore::ByteOrder;
    if (size == 4) {
        uint32_t bits = ByteOrder::ReadBE32(p);
        float f;
        std::memcpy(&f, &bits, sizeof(f));
        return static_cast<double>(f);
    }
    if (size == 8) {
        uint64_t bits = ByteOrder::ReadBE64(p);
        double d;
        std::memcpy(&d, &bits, sizeof(d));
        return d;
    }
    // Integer-encoded or odd-width floats are not decoded
    return 0.0;
}

} // namespace lmshao::lmmeta
