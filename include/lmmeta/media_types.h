/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMMETA_MEDIA_TYPES_H
#define LMSHAO_LMMETA_MEDIA_TYPES_H

#include <cstdint>
#include <string>

namespace lmshao::lmmeta {

// Duration-related fields recovered from a Matroska Info element.
struct DurationMetadata {
    uint64_t timecode_scale = 0;       // nanoseconds per tick
    double duration = 0.0;             // raw tick count as stored
    double video_duration_seconds = 0; // duration * timecode_scale / 1e9
};

enum class MetadataErrorKind {
    kNone,
    kFormat,             // not a valid/supported container
    kIncompleteMetadata, // regions scanned, a field never found
    kIo,                 // read, seek or open failure
};

enum class MetadataErrorCode {
    kOk = 0,
    kInvalidHeader,
    kMissingSegment,
    kInvalidVint,
    kElementTooLarge,
    kMissingTimecodeScale,
    kMissingDuration,
    kIoError,
};

/**
 * @brief Structured failure of a metadata extraction
 *
 * Fields that do not apply to a given code are left at zero.
 */
struct MetadataError {
    MetadataErrorCode code = MetadataErrorCode::kOk;
    uint64_t offset = 0;      // byte offset where the failure was detected
    uint64_t expected_id = 0; // kInvalidHeader, kMissingSegment
    uint64_t found_id = 0;    // kInvalidHeader, kMissingSegment, kElementTooLarge
    uint64_t requested = 0;   // kIoError, kElementTooLarge: bytes asked for
    uint64_t available = 0;   // kIoError: bytes left in the input
    int sys_errno = 0;        // kIoError on open
    std::string path;

    MetadataErrorKind Kind() const;
    bool Ok() const { return code == MetadataErrorCode::kOk; }
    std::string ToString() const;
};

const char *MetadataErrorCodeName(MetadataErrorCode code);

// Render seconds as HH:MM:SS, dropping the fractional part.
std::string FormatDuration(double seconds);

} // namespace lmshao::lmmeta

#endif // LMSHAO_LMMETA_MEDIA_TYPES_H
