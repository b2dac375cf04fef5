/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstdio>
#include <cstring>
#include <string>

#include "lmmeta/lmmeta_logger.h"
#include "lmmeta/matroska_parser.h"

using namespace lmshao::lmmeta;

// Failures render as 00:00:00, the reason goes to stderr.
static bool DurationText(const std::string &path, std::string &text)
{
    DurationMetadata meta;
    MetadataError error;
    if (!ExtractDurationMetadata(path, meta, error)) {
        if (error.Kind() == MetadataErrorKind::kIncompleteMetadata) {
            std::fprintf(stderr, "%s: duration unknown (%s)\n", path.c_str(), error.ToString().c_str());
        } else {
            std::fprintf(stderr, "%s: failed to get video duration: %s\n", path.c_str(), error.ToString().c_str());
        }
        text = FormatDuration(0.0);
        return false;
    }

    std::printf("%s\n", path.c_str());
    std::printf("  TimecodeScale(ns): %llu\n", (unsigned long long)meta.timecode_scale);
    std::printf("  Duration(ticks): %.3f\n", meta.duration);
    std::printf("  Duration(s): %.3f\n", meta.video_duration_seconds);
    text = FormatDuration(meta.video_duration_seconds);
    return true;
}

int main(int argc, char **argv)
{
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s [-v] <input.mkv|input.webm> [...]\n", argv[0]);
        return 1;
    }

    int first = 1;
    if (std::strcmp(argv[1], "-v") == 0) {
        InitLmmetaLogger(lmshao::lmcore::LogLevel::kDebug);
        first = 2;
    } else {
        InitLmmetaLogger(lmshao::lmcore::LogLevel::kWarn);
    }

    int failures = 0;
    for (int i = first; i < argc; ++i) {
        std::string text;
        if (!DurationText(argv[i], text)) {
            ++failures;
        }
        std::printf("%s\t%s\n", text.c_str(), argv[i]);
    }
    return failures == 0 ? 0 : 3;
}
