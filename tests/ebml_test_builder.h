/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMMETA_TESTS_EBML_TEST_BUILDER_H
#define LMSHAO_LMMETA_TESTS_EBML_TEST_BUILDER_H

#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <vector>

#include "lmmeta/matroska_parser.h"

namespace lmshao::lmmeta::test {

using Bytes = std::vector<uint8_t>;

// Element ID bytes as written in the file (marker bits included)
inline Bytes IdBytes(uint64_t id)
{
    Bytes out;
    int width = 1;
    while (width < 4 && (id >> (8 * width)) != 0) {
        ++width;
    }
    for (int i = width - 1; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(id >> (8 * i)));
    }
    return out;
}

// Shortest size varint for values below 2^56 - 1
inline Bytes SizeBytes(uint64_t size)
{
    int width = 1;
    while (width < 8 && size >= ((1ULL << (7 * width)) - 1)) {
        ++width;
    }
    Bytes out;
    uint64_t v = size | (1ULL << (7 * width));
    for (int i = width - 1; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
    return out;
}

inline Bytes UintBytes(uint64_t v, int width)
{
    Bytes out;
    for (int i = width - 1; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
    return out;
}

inline Bytes Float64Bytes(double d)
{
    uint64_t bits;
    std::memcpy(&bits, &d, sizeof(bits));
    return UintBytes(bits, 8);
}

inline Bytes Float32Bytes(float f)
{
    uint32_t bits;
    std::memcpy(&bits, &f, sizeof(bits));
    return UintBytes(bits, 4);
}

inline void Append(Bytes &dst, const Bytes &src)
{
    dst.insert(dst.end(), src.begin(), src.end());
}

inline Bytes Element(uint64_t id, const Bytes &payload)
{
    Bytes out = IdBytes(id);
    Append(out, SizeBytes(payload.size()));
    Append(out, payload);
    return out;
}

inline Bytes Concat(std::initializer_list<Bytes> parts)
{
    Bytes out;
    for (const auto &p : parts) {
        Append(out, p);
    }
    return out;
}

// EBML header with DocType "matroska"
inline Bytes EbmlHeader()
{
    Bytes doc_type = {'m', 'a', 't', 'r', 'o', 's', 'k', 'a'};
    Bytes body = Concat({Element(0x4286, {0x01}),   // EBMLVersion
                         Element(0x42F7, {0x01}),   // EBMLReadVersion
                         Element(0x4282, doc_type), // DocType
                         Element(0x4287, {0x04}),   // DocTypeVersion
                         Element(0x4285, {0x02})}); // DocTypeReadVersion
    return Element(kEbmlHeaderId, body);
}

inline Bytes TimecodeScale(uint64_t ns, int width = 3)
{
    return Element(kTimecodeScaleId, UintBytes(ns, width));
}

inline Bytes Duration(double ticks)
{
    return Element(kDurationId, Float64Bytes(ticks));
}

// EBML header + Segment wrapping the given children
inline Bytes MatroskaFile(const Bytes &segment_children)
{
    return Concat({EbmlHeader(), Element(kSegmentId, segment_children)});
}

} // namespace lmshao::lmmeta::test

#endif // LMSHAO_LMMETA_TESTS_EBML_TEST_BUILDER_H
