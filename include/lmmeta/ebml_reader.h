/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMMETA_EBML_READER_H
#define LMSHAO_LMMETA_EBML_READER_H

#include <cstddef>
#include <cstdint>

namespace lmshao::lmmeta {

struct EbmlElementHeader {
    uint64_t id;
    uint64_t size;
};

// Bounds-checked forward cursor over a caller-owned buffer
struct BufferCursor {
    const uint8_t *data;
    size_t size;
    size_t pos;
    BufferCursor(const uint8_t *d, size_t s) : data(d), size(s), pos(0) {}
    size_t Read(uint8_t *dst, size_t n)
    {
        size_t remain = Remaining();
        size_t to_read = n < remain ? n : remain;
        for (size_t i = 0; i < to_read; ++i)
            dst[i] = data[pos + i];
        pos += to_read;
        return to_read;
    }
    // Fails without moving when offset lies past the end of the buffer.
    bool Seek(uint64_t offset)
    {
        if (offset > size)
            return false;
        pos = static_cast<size_t>(offset);
        return true;
    }
    size_t Tell() const { return pos; }
    size_t Size() const { return size; }
    size_t Remaining() const { return (pos < size) ? (size - pos) : 0; }
};

enum class VintMode {
    kId,   // keep the length marker bit (element identifiers)
    kSize, // strip the length marker bit (element sizes)
};

enum class EbmlStatus {
    kOk,
    kEndOfBuffer, // input ended inside the value
    kInvalidVint, // no marker bit in the first byte, or ID wider than 4 bytes
};

// Failure detail of a varint read
struct EbmlError {
    EbmlStatus status = EbmlStatus::kOk;
    size_t offset = 0; // start of the varint that failed
    size_t needed = 0; // bytes that varint required (1 when even the first byte is missing)
};

// Largest element identifier width allowed by EBML (class D IDs).
static constexpr size_t kMaxEbmlIdWidth = 4;

/**
 * @brief Read one EBML variable-length integer
 * @param cur cursor positioned at the first byte of the encoding
 * @param mode whether the marker bit is kept (ID) or stripped (size)
 * @param value receives the decoded value on success
 * @param err optional, receives the failure reason and position
 * @return number of bytes consumed, 0 on failure
 */
size_t ReadVint(BufferCursor &cur, VintMode mode, uint64_t &value, EbmlError *err = nullptr);

// Read EBML varint for element ID; keeps leading 1-bit.
size_t ReadVintId(BufferCursor &cur, uint64_t &value, EbmlError *err = nullptr);

// Read EBML varint for element size; strips leading 1-bit.
size_t ReadVintSize(BufferCursor &cur, uint64_t &value, EbmlError *err = nullptr);

// Parse next element header from current position.
bool NextElement(BufferCursor &cur, EbmlElementHeader &out, EbmlError *err = nullptr);

// Skip an element payload of the given size; fails when it runs past the end.
bool SkipBytes(BufferCursor &cur, uint64_t size);

// Big-endian unsigned integer of up to 8 bytes.
uint64_t ReadUnsignedBE(const uint8_t *p, size_t size);

// Big-endian IEEE float: 4 bytes widened, 8 bytes as is, any other width is 0.0.
double ReadFloatBE(const uint8_t *p, size_t size);

} // namespace lmshao::lmmeta

#endif // LMSHAO_LMMETA_EBML_READER_H
