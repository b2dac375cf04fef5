/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmmeta/media_types.h"

#include <cstdio>
#include <cstring>
#include <limits>

namespace lmshao::lmmeta {

MetadataErrorKind MetadataError::Kind() const
{
    switch (code) {
        case MetadataErrorCode::kOk:
            return MetadataErrorKind::kNone;
        case MetadataErrorCode::kInvalidHeader:
        case MetadataErrorCode::kMissingSegment:
        case MetadataErrorCode::kInvalidVint:
        case MetadataErrorCode::kElementTooLarge:
            return MetadataErrorKind::kFormat;
        case MetadataErrorCode::kMissingTimecodeScale:
        case MetadataErrorCode::kMissingDuration:
            return MetadataErrorKind::kIncompleteMetadata;
        case MetadataErrorCode::kIoError:
            return MetadataErrorKind::kIo;
    }
    return MetadataErrorKind::kFormat;
}

const char *MetadataErrorCodeName(MetadataErrorCode code)
{
    switch (code) {
        case MetadataErrorCode::kOk:
            return "ok";
        case MetadataErrorCode::kInvalidHeader:
            return "invalid EBML header";
        case MetadataErrorCode::kMissingSegment:
            return "missing Segment element";
        case MetadataErrorCode::kInvalidVint:
            return "invalid variable-length integer";
        case MetadataErrorCode::kElementTooLarge:
            return "element payload too large";
        case MetadataErrorCode::kMissingTimecodeScale:
            return "missing TimecodeScale";
        case MetadataErrorCode::kMissingDuration:
            return "missing Duration";
        case MetadataErrorCode::kIoError:
            return "I/O error";
    }
    return "unknown error";
}

std::string MetadataError::ToString() const
{
    char buf[256];
    switch (code) {
        case MetadataErrorCode::kOk:
            return MetadataErrorCodeName(code);
        case MetadataErrorCode::kInvalidHeader:
        case MetadataErrorCode::kMissingSegment:
            std::snprintf(buf, sizeof(buf), "%s at offset %llu: expected ID 0x%llX, found 0x%llX",
                          MetadataErrorCodeName(code), (unsigned long long)offset, (unsigned long long)expected_id,
                          (unsigned long long)found_id);
            break;
        case MetadataErrorCode::kElementTooLarge:
            std::snprintf(buf, sizeof(buf), "%s at offset %llu: element 0x%llX declares %llu bytes",
                          MetadataErrorCodeName(code), (unsigned long long)offset, (unsigned long long)found_id,
                          (unsigned long long)requested);
            break;
        case MetadataErrorCode::kIoError:
            if (sys_errno != 0) {
                std::snprintf(buf, sizeof(buf), "%s: %s", MetadataErrorCodeName(code), std::strerror(sys_errno));
            } else if (requested == 0) {
                std::snprintf(buf, sizeof(buf), "%s: cannot open file", MetadataErrorCodeName(code));
            } else {
                std::snprintf(buf, sizeof(buf), "%s at offset %llu: requested %llu bytes, %llu available",
                              MetadataErrorCodeName(code), (unsigned long long)offset, (unsigned long long)requested,
                              (unsigned long long)available);
            }
            break;
        default:
            std::snprintf(buf, sizeof(buf), "%s at offset %llu", MetadataErrorCodeName(code),
                          (unsigned long long)offset);
            break;
    }
    std::string out(buf);
    if (!path.empty()) {
        out += " (" + path + ")";
    }
    return out;
}

std::string FormatDuration(double seconds)
{
    // Saturating conversion: negative and NaN become 0
    uint64_t total = 0;
    if (seconds >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
        total = std::numeric_limits<uint64_t>::max();
    } else if (seconds > 0) {
        total = static_cast<uint64_t>(seconds);
    }
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%02llu:%02llu:%02llu", (unsigned long long)(total / 3600),
                  (unsigned long long)(total % 3600 / 60), (unsigned long long)(total % 60));
    return buf;
}

} // namespace lmshao::lmmeta
