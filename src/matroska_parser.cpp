/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmmeta/matroska_parser.h"

#include <cerrno>

#include "internal_logger.h"
#include "lmcore/byte_order.h"
#include "lmcore/mapped_file.h"
#include "lmmeta/ebml_reader.h"

namespace lmshao::lmmeta {

static constexpr double kNanosecondsPerSecond = 1000000000.0;

// Values found inside one Info region
struct InfoFields {
    bool has_timecode_scale = false;
    bool has_duration = false;
    uint64_t timecode_scale = 0;
    double duration = 0.0;
    bool Complete() const { return has_timecode_scale && has_duration; }
};

static bool FailIo(MetadataError &error, size_t offset, uint64_t requested, size_t available)
{
    error = MetadataError{};
    error.code = MetadataErrorCode::kIoError;
    error.offset = offset;
    error.requested = requested;
    error.available = available;
    LMMETA_LOGE("Read past end of input at offset %zu: requested %llu bytes, %zu available", offset,
                (unsigned long long)requested, available);
    return false;
}

// Maps a failed varint read to an error at the start of that varint.
static bool FailVint(MetadataError &error, const EbmlError &vint, const BufferCursor &cur)
{
    if (vint.status == EbmlStatus::kInvalidVint) {
        error = MetadataError{};
        error.code = MetadataErrorCode::kInvalidVint;
        error.offset = vint.offset;
        return false;
    }
    return FailIo(error, vint.offset, vint.needed, cur.Size() - vint.offset);
}

static bool ReadElementHeader(BufferCursor &cur, EbmlElementHeader &hdr, MetadataError &error)
{
    EbmlError vint;
    if (!NextElement(cur, hdr, &vint)) {
        return FailVint(error, vint, cur);
    }
    return true;
}

static bool SkipPayload(BufferCursor &cur, uint64_t size, MetadataError &error)
{
    if (!SkipBytes(cur, size)) {
        return FailIo(error, cur.Tell(), size, cur.Remaining());
    }
    return true;
}

// Reads a TimecodeScale or Duration payload into buf (at most 8 bytes).
static bool ReadSmallPayload(BufferCursor &cur, const EbmlElementHeader &kv, uint8_t (&buf)[8], MetadataError &error)
{
    if (kv.size > sizeof(buf)) {
        error = MetadataError{};
        error.code = MetadataErrorCode::kElementTooLarge;
        error.offset = cur.Tell();
        error.found_id = kv.id;
        error.requested = kv.size;
        LMMETA_LOGE("Element 0x%llX declares %llu bytes, at most 8 expected", (unsigned long long)kv.id,
                    (unsigned long long)kv.size);
        return false;
    }
    size_t to_read = static_cast<size_t>(kv.size);
    size_t offset = cur.Tell();
    size_t available = cur.Remaining();
    if (cur.Read(buf, to_read) != to_read) {
        return FailIo(error, offset, to_read, available);
    }
    return true;
}

static bool ParseInfo(BufferCursor &cur, uint64_t info_end, InfoFields &fields, MetadataError &error)
{
    while (cur.Tell() < info_end && !fields.Complete()) {
        EbmlElementHeader kv{};
        if (!ReadElementHeader(cur, kv, error)) {
            return false;
        }
        if (kv.id == kTimecodeScaleId) {
            uint8_t buf[8] = {0};
            if (!ReadSmallPayload(cur, kv, buf, error)) {
                return false;
            }
            fields.timecode_scale = ReadUnsignedBE(buf, static_cast<size_t>(kv.size));
            fields.has_timecode_scale = true;
        } else if (kv.id == kDurationId) {
            uint8_t buf[8] = {0};
            if (!ReadSmallPayload(cur, kv, buf, error)) {
                return false;
            }
            if (kv.size != 4 && kv.size != 8) {
                LMMETA_LOGW("Duration stored in %llu bytes is not an IEEE float, reading as 0",
                            (unsigned long long)kv.size);
            }
            fields.duration = ReadFloatBE(buf, static_cast<size_t>(kv.size));
            fields.has_duration = true;
        } else {
            LMMETA_LOGD("Skipping Info child 0x%llX, size %llu", (unsigned long long)kv.id,
                        (unsigned long long)kv.size);
            if (!SkipPayload(cur, kv.size, error)) {
                return false;
            }
        }
    }
    return true;
}

bool MatroskaParser::ParseBuffer(const uint8_t *data, size_t size, DurationMetadata &meta, MetadataError &error) const
{
    using lmshao::lmcore::ByteOrder;
    BufferCursor cur(data, size);

    // The magic is compared as raw bytes, nothing else is read on mismatch
    uint8_t magic[4] = {0};
    if (cur.Read(magic, sizeof(magic)) != sizeof(magic)) {
        return FailIo(error, 0, sizeof(magic), size);
    }
    uint32_t found = ByteOrder::ReadBE32(magic);
    if (found != kEbmlHeaderId) {
        error = MetadataError{};
        error.code = MetadataErrorCode::kInvalidHeader;
        error.expected_id = kEbmlHeaderId;
        error.found_id = found;
        LMMETA_LOGE("Unexpected first element ID: 0x%08X, expected EBML", found);
        return false;
    }

    // Skip EBML header payload
    uint64_t header_size = 0;
    EbmlError vint;
    if (ReadVintSize(cur, header_size, &vint) == 0) {
        return FailVint(error, vint, cur);
    }
    if (!SkipPayload(cur, header_size, error)) {
        return false;
    }

    size_t segment_offset = cur.Tell();
    uint64_t segment_id = 0;
    if (ReadVintId(cur, segment_id, &vint) == 0) {
        return FailVint(error, vint, cur);
    }
    if (segment_id != kSegmentId) {
        error = MetadataError{};
        error.code = MetadataErrorCode::kMissingSegment;
        error.offset = segment_offset;
        error.expected_id = kSegmentId;
        error.found_id = segment_id;
        LMMETA_LOGE("Unexpected element ID 0x%llX at offset %zu, expected Segment", (unsigned long long)segment_id,
                    segment_offset);
        return false;
    }
    uint64_t segment_size = 0;
    if (ReadVintSize(cur, segment_size, &vint) == 0) {
        return FailVint(error, vint, cur);
    }

    uint64_t segment_end = static_cast<uint64_t>(cur.Tell()) + segment_size;
    InfoFields fields;
    while (cur.Tell() < segment_end) {
        EbmlElementHeader child{};
        if (!ReadElementHeader(cur, child, error)) {
            return false;
        }
        if (child.id == kInfoId) {
            uint64_t info_end = static_cast<uint64_t>(cur.Tell()) + child.size;
            LMMETA_LOGD("Info at offset %zu, size %llu", cur.Tell(), (unsigned long long)child.size);
            fields = InfoFields{};
            if (!ParseInfo(cur, info_end, fields, error)) {
                return false;
            }
            if (fields.Complete()) {
                break;
            }
        } else {
            LMMETA_LOGD("Skipping Segment child 0x%llX, size %llu", (unsigned long long)child.id,
                        (unsigned long long)child.size);
            if (!SkipPayload(cur, child.size, error)) {
                return false;
            }
        }
    }

    if (!fields.has_timecode_scale) {
        error = MetadataError{};
        error.code = MetadataErrorCode::kMissingTimecodeScale;
        error.offset = cur.Tell();
        LMMETA_LOGE("Segment scanned up to offset %zu without TimecodeScale", cur.Tell());
        return false;
    }
    if (!fields.has_duration) {
        error = MetadataError{};
        error.code = MetadataErrorCode::kMissingDuration;
        error.offset = cur.Tell();
        LMMETA_LOGE("Segment scanned up to offset %zu without Duration", cur.Tell());
        return false;
    }

    meta.timecode_scale = fields.timecode_scale;
    meta.duration = fields.duration;
    meta.video_duration_seconds = fields.duration * static_cast<double>(fields.timecode_scale) / kNanosecondsPerSecond;
    error = MetadataError{};
    LMMETA_LOGI("Parsed Matroska: timecode_scale=%llu ns, duration=%.3f, seconds=%.3f",
                (unsigned long long)meta.timecode_scale, meta.duration, meta.video_duration_seconds);
    return true;
}

bool ExtractDurationMetadata(const std::string &path, DurationMetadata &meta, MetadataError &error)
{
    errno = 0;
    auto mf = lmshao::lmcore::MappedFile::Open(path);
    if (!mf || !mf->IsValid()) {
        error = MetadataError{};
        error.code = MetadataErrorCode::kIoError;
        error.sys_errno = errno;
        error.path = path;
        LMMETA_LOGE("Cannot open input file: %s", path.c_str());
        return false;
    }

    MatroskaParser parser;
    if (!parser.ParseBuffer(mf->Data(), mf->Size(), meta, error)) {
        error.path = path;
        return false;
    }
    return true;
}

} // namespace lmshao::lmmeta
