/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "ebml_test_builder.h"
#include "lmmeta/lmmeta_logger.h"
#include "lmmeta/matroska_parser.h"

using namespace lmshao::lmmeta;
using namespace lmshao::lmmeta::test;

namespace fs = std::filesystem;

static fs::path WriteTempFile(const std::string &name, const Bytes &bytes)
{
    fs::path path = fs::temp_directory_path() / ("lmmeta_" + name);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.close();
    assert(out.good());
    return path;
}

static Bytes FileWithDuration(double ticks)
{
    Bytes info = Concat({TimecodeScale(1000000), Element(0x7BA9, {'t', 'e', 's', 't'}), Duration(ticks)});
    return MatroskaFile(Concat({Element(0xEC, Bytes(64, 0x00)), Element(kInfoId, info)}));
}

// The first library log must not replace the level chosen by the caller
static void TestExplicitLoggerLevelKept()
{
    assert(LmmetaLoggerInitialized().load());
    DurationMetadata meta;
    MetadataError error;
    assert(!ExtractDurationMetadata((fs::temp_directory_path() / "lmmeta_no_such_file.mkv").string(), meta, error));
    auto &logger = lmshao::lmcore::LoggerRegistry::GetLogger<LmmetaModuleTag>();
    assert(logger.ShouldLog(lmshao::lmcore::LogLevel::kDebug));
}

static void TestExtractFromFile()
{
    fs::path path = WriteTempFile("valid.mkv", FileWithDuration(7384000.0));
    DurationMetadata meta;
    MetadataError error;
    assert(ExtractDurationMetadata(path.string(), meta, error));
    assert(error.Ok());
    assert(meta.timecode_scale == 1000000);
    assert(std::fabs(meta.video_duration_seconds - 7384.0) < 1e-9);
    assert(FormatDuration(meta.video_duration_seconds) == "02:03:04");
    fs::remove(path);
}

static void TestMissingFile()
{
    fs::path path = fs::temp_directory_path() / "lmmeta_does_not_exist.mkv";
    fs::remove(path);
    DurationMetadata meta;
    MetadataError error;
    assert(!ExtractDurationMetadata(path.string(), meta, error));
    assert(error.code == MetadataErrorCode::kIoError);
    assert(error.Kind() == MetadataErrorKind::kIo);
    assert(error.path == path.string());
    assert(!error.ToString().empty());
}

static void TestNotMatroska()
{
    Bytes riff = {'R', 'I', 'F', 'F', 0x24, 0x00, 0x00, 0x00, 'A', 'V', 'I', ' '};
    fs::path path = WriteTempFile("not_mkv.avi", riff);
    DurationMetadata meta;
    MetadataError error;
    assert(!ExtractDurationMetadata(path.string(), meta, error));
    assert(error.code == MetadataErrorCode::kInvalidHeader);
    assert(error.path == path.string());
    assert(error.ToString().find("0x52494646") != std::string::npos);
    fs::remove(path);
}

static void TestEmptyFile()
{
    fs::path path = WriteTempFile("empty.mkv", {});
    DurationMetadata meta;
    MetadataError error;
    assert(!ExtractDurationMetadata(path.string(), meta, error));
    assert(error.Kind() == MetadataErrorKind::kIo);
    fs::remove(path);
}

static void TestIncompleteFile()
{
    fs::path path = WriteTempFile("no_duration.webm", MatroskaFile(Element(kInfoId, TimecodeScale(1000000))));
    DurationMetadata meta;
    MetadataError error;
    assert(!ExtractDurationMetadata(path.string(), meta, error));
    assert(error.code == MetadataErrorCode::kMissingDuration);
    assert(error.Kind() == MetadataErrorKind::kIncompleteMetadata);
    fs::remove(path);
}

// Distinct files extracted from several threads at once
static void TestConcurrentExtraction()
{
    const int kFiles = 8;
    std::vector<fs::path> paths;
    for (int i = 0; i < kFiles; ++i) {
        paths.push_back(WriteTempFile("concurrent_" + std::to_string(i) + ".mkv", FileWithDuration(1000.0 * (i + 1))));
    }

    std::vector<double> seconds(kFiles, -1.0);
    std::vector<std::thread> workers;
    for (int i = 0; i < kFiles; ++i) {
        workers.emplace_back([&, i]() {
            DurationMetadata meta;
            MetadataError error;
            if (ExtractDurationMetadata(paths[i].string(), meta, error)) {
                seconds[i] = meta.video_duration_seconds;
            }
        });
    }
    for (auto &t : workers) {
        t.join();
    }
    for (int i = 0; i < kFiles; ++i) {
        assert(std::fabs(seconds[i] - (i + 1)) < 1e-9);
        fs::remove(paths[i]);
    }
}

int main()
{
    InitLmmetaLogger(lmshao::lmcore::LogLevel::kDebug);

    TestExplicitLoggerLevelKept();
    TestExtractFromFile();
    TestMissingFile();
    TestNotMatroska();
    TestEmptyFile();
    TestIncompleteFile();
    TestConcurrentExtraction();
    return 0;
}
