#include "zPipelineUnpack.h"

#include "zContainerReader.h"
#include "zFile.h"
#include "zLog.h"
#include "zPipelineSections.h"

#include <filesystem>
#include <fstream>

// 文件系统命名空间别名。
namespace fs = std::filesystem;

namespace bpk {

namespace {

// 超过两位编号的节仍会导出，但 repack 只认两位编号。
constexpr size_t kMaxRepackableSections = 100;

// 删除写到一半的节文件，避免留下内容不明的产物。
void removePartialOutput(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        LOGW("failed to remove partial output %s: %s", path.c_str(), ec.message().c_str());
    }
}

}  // namespace

bool unpackBattlePack(const std::string& containerPath,
                      const std::string& outputDir,
                      base::zBpError* error) {
    if (!base::file::fileExists(containerPath)) {
        return base::setBpError(error, base::BpErrorCode::kNotFound,
                                "battle pack not found: " + containerPath);
    }
    if (!base::file::ensureDirectory(outputDir)) {
        return base::setBpError(error, base::BpErrorCode::kDirectoryFailure,
                                "failed to create output folder: " + outputDir);
    }

    container::zContainerReader reader;
    if (!reader.open(containerPath, error)) {
        return false;
    }
    if (reader.sectionCount() > kMaxRepackableSections) {
        LOGW("%s has %zu sections; sections from %zu on get 3-digit names and are skipped by repack",
             containerPath.c_str(),
             reader.sectionCount(),
             kMaxRepackableSections);
    }

    for (size_t i = 0; i < reader.sectionCount(); ++i) {
        // 节表已在 open 时校验，索引在范围内时查询必然成功。
        container::zSectionEntry entry;
        if (!reader.sectionEntry(i, &entry)) {
            return base::setBpError(error, base::BpErrorCode::kContractViolation,
                                    "section " + std::to_string(i) + " missing from section table");
        }
        const std::string outPath = (fs::path(outputDir) / sectionFileName(i)).string();
        std::ofstream out(outPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            return base::setBpError(error, base::BpErrorCode::kIoFailure,
                                    "failed to create output file " + outPath);
        }

        uint64_t written = 0;
        if (!reader.extractSection(i, out, &written, error)) {
            out.close();
            removePartialOutput(outPath);
            if (error != nullptr) {
                error->message = "section " + std::to_string(i) + ": " + error->message;
            }
            return false;
        }
        out.close();
        if (!out) {
            removePartialOutput(outPath);
            return base::setBpError(error, base::BpErrorCode::kIoFailure,
                                    "failed to write export for section " + std::to_string(i) + " to " + outPath);
        }
        LOGI("Exporting section %zu, %llu bytes.", i, static_cast<unsigned long long>(written));
        LOGD("section %zu: offset=0x%llx -> %s",
             i,
             static_cast<unsigned long long>(entry.offset),
             outPath.c_str());
    }

    LOGI("unpack success: %s -> %s (%zu sections)",
         containerPath.c_str(),
         outputDir.c_str(),
         reader.sectionCount());
    base::clearBpError(error);
    return true;
}

}  // namespace bpk
