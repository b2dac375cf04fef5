/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMMETA_MATROSKA_PARSER_H
#define LMSHAO_LMMETA_MATROSKA_PARSER_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "lmmeta/media_types.h"

namespace lmshao::lmmeta {

// Element IDs used on the way to the duration fields
static constexpr uint64_t kEbmlHeaderId = 0x1A45DFA3ULL;  // EBML
static constexpr uint64_t kSegmentId = 0x18538067ULL;     // Segment
static constexpr uint64_t kInfoId = 0x1549A966ULL;        // Info
static constexpr uint64_t kTimecodeScaleId = 0x2AD7B1ULL; // TimecodeScale
static constexpr uint64_t kDurationId = 0x4489ULL;        // Duration

/**
 * @brief Single forward pass over EBML header, Segment and Info
 *
 * Only TimecodeScale and Duration are decoded; every other element is skipped
 * by its declared size. Stateless, one instance may be shared between threads.
 */
class MatroskaParser {
public:
    MatroskaParser() = default;

    // Parse from memory buffer without IO. meta is only written on success.
    bool ParseBuffer(const uint8_t *data, size_t size, DurationMetadata &meta, MetadataError &error) const;
};

/**
 * @brief Open a Matroska/WebM file read-only and recover its duration
 * @param path file to inspect
 * @param meta filled on success only
 * @param error filled on failure
 * @return true when both TimecodeScale and Duration were found
 */
bool ExtractDurationMetadata(const std::string &path, DurationMetadata &meta, MetadataError &error);

} // namespace lmshao::lmmeta

#endif // LMSHAO_LMMETA_MATROSKA_PARSER_H
