#include "zFile.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace bpk::base::file {

bool fileExists(const std::string& path) {
    if (path.empty()) {
        return false;
    }
    // error_code 版本：权限不足等情况按“不存在”处理，不抛异常。
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool ensureDirectory(const std::string& path) {
    if (path.empty()) {
        return false;
    }
    std::error_code ec;
    const fs::file_status status = fs::status(path, ec);
    if (fs::exists(status)) {
        // 输出目录位置被普通文件占用。
        return fs::is_directory(status);
    }
    fs::create_directories(path, ec);
    // 以最终状态为准：并发创建时 create_directories 也可能报告未创建。
    return !ec && fs::is_directory(path, ec);
}

bool readFileBytes(const std::string& path, std::vector<uint8_t>* out, zBpError* error) {
    if (out == nullptr) {
        return setBpError(error, BpErrorCode::kContractViolation, "file output buffer is null");
    }
    out->clear();

    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        return setBpError(error, BpErrorCode::kIoFailure, "failed to open input file " + path);
    }
    // ate 打开后读指针在末尾，tellg 即文件长度。
    const std::streamoff size = in.tellg();
    if (size < 0) {
        return setBpError(error, BpErrorCode::kIoFailure, "failed to determine size of " + path);
    }
    out->resize(static_cast<size_t>(size));
    in.seekg(0, std::ios::beg);
    if (!out->empty()) {
        in.read(reinterpret_cast<char*>(out->data()), static_cast<std::streamsize>(out->size()));
    }
    if (!in || static_cast<uint64_t>(in.gcount()) != out->size()) {
        out->clear();
        return setBpError(error, BpErrorCode::kIoFailure, "failed to read input file " + path);
    }
    clearBpError(error);
    return true;
}

}  // namespace bpk::base::file
