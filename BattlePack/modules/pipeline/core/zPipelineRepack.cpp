#include "zPipelineRepack.h"

#include "zContainerWriter.h"
#include "zFile.h"
#include "zLog.h"
#include "zPipelineSections.h"

#include <filesystem>
#include <fstream>
#include <vector>

namespace bpk {

namespace {

// 写出全部节；任何失败由调用方负责清理输出文件。
bool writeSections(const std::vector<SectionFileEntry>& files,
                   std::ofstream& out,
                   base::zBpError* error) {
    container::zContainerWriter writer(out, static_cast<uint32_t>(files.size()));
    std::vector<uint8_t> data;
    for (size_t i = 0; i < files.size(); ++i) {
        const SectionFileEntry& file = files[i];
        if (!base::file::readFileBytes(file.path, &data, error)) {
            return false;
        }
        if (!writer.writeSection(data, error)) {
            if (error != nullptr) {
                error->message = "failed to write section " + std::to_string(i) + " to output file: " +
                                 error->message;
            }
            return false;
        }
        LOGI("Packing section %zu from %s, %zu bytes.", i, file.path.c_str(), data.size());
    }
    return writer.finish(error);
}

}  // namespace

bool repackBattlePack(const std::string& inputDir,
                      const std::string& outputPath,
                      base::zBpError* error) {
    // 先收集输入，输入目录不合法时不创建输出文件。
    std::vector<SectionFileEntry> files;
    if (!collectSectionFiles(inputDir, &files, error)) {
        return false;
    }
    // 编号不连续时按排序结果依次打包，节会被重新编号。
    for (size_t i = 0; i < files.size(); ++i) {
        if (files[i].index != i) {
            LOGW("section numbering has a gap: %s is packed as section %zu",
                 files[i].path.c_str(),
                 i);
        }
    }

    std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        return base::setBpError(error, base::BpErrorCode::kIoFailure,
                                "failed to create output file " + outputPath);
    }

    bool ok = writeSections(files, out, error);
    out.close();
    if (ok && !out) {
        ok = base::setBpError(error, base::BpErrorCode::kIoFailure, "failed to close output file " + outputPath);
    }
    if (!ok) {
        std::error_code ec;
        std::filesystem::remove(outputPath, ec);
        if (ec) {
            LOGW("failed to remove partial output %s: %s", outputPath.c_str(), ec.message().c_str());
        }
        return false;
    }

    LOGI("repack success: %s -> %s (%zu sections)", inputDir.c_str(), outputPath.c_str(), files.size());
    base::clearBpError(error);
    return true;
}

}  // namespace bpk
