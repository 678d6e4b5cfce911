// 引入节文件命名规则声明。
#include "zPipelineSections.h"

// 引入日志接口。
#include "zLog.h"

// 引入排序。
#include <algorithm>
// 引入 snprintf。
#include <cstdio>
// 引入目录遍历。
#include <filesystem>

// 文件系统命名空间别名。
namespace fs = std::filesystem;

namespace bpk {

namespace {

// 固定前缀与后缀。
constexpr char kSectionPrefix[] = "section_";
constexpr char kSectionSuffix[] = ".bin";
// 前缀长度。
constexpr size_t kSectionPrefixLength = sizeof(kSectionPrefix) - 1;
// 编号位数。
constexpr size_t kSectionIndexDigits = 2;
// 合法文件名总长度：section_ + NN + .bin。
constexpr size_t kSectionFileNameLength = kSectionPrefixLength + kSectionIndexDigits + sizeof(kSectionSuffix) - 1;

}  // namespace

std::string sectionFileName(const size_t index) {
    char name[64];
    std::snprintf(name, sizeof(name), "%s%02zu%s", kSectionPrefix, index, kSectionSuffix);
    return std::string(name);
}

bool parseSectionFileName(const std::string& fileName, uint32_t* outIndex) {
    if (outIndex == nullptr || fileName.size() != kSectionFileNameLength) {
        return false;
    }
    if (fileName.compare(0, kSectionPrefixLength, kSectionPrefix) != 0) {
        return false;
    }
    if (fileName.compare(kSectionPrefixLength + kSectionIndexDigits, std::string::npos, kSectionSuffix) != 0) {
        return false;
    }
    uint32_t index = 0;
    for (size_t i = 0; i < kSectionIndexDigits; ++i) {
        const char c = fileName[kSectionPrefixLength + i];
        if (c < '0' || c > '9') {
            return false;
        }
        index = index * 10 + static_cast<uint32_t>(c - '0');
    }
    *outIndex = index;
    return true;
}

bool collectSectionFiles(const std::string& inputDir,
                         std::vector<SectionFileEntry>* out,
                         base::zBpError* error) {
    if (out == nullptr) {
        return base::setBpError(error, base::BpErrorCode::kContractViolation, "section list output is null");
    }
    out->clear();

    std::error_code ec;
    if (!fs::is_directory(inputDir, ec)) {
        return base::setBpError(error, base::BpErrorCode::kNotFound,
                                "input directory is nonexistent or is not a directory: " + inputDir);
    }

    fs::directory_iterator it(inputDir, ec);
    if (ec) {
        return base::setBpError(error, base::BpErrorCode::kIoFailure,
                                "failed to open input directory " + inputDir + ": " + ec.message());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        uint32_t index = 0;
        if (!parseSectionFileName(it->path().filename().string(), &index)) {
            continue;
        }
        // is_regular_file 跟随符号链接；目录和悬空链接被忽略。
        std::error_code typeEc;
        if (!fs::is_regular_file(it->path(), typeEc)) {
            LOGD("skip non-regular entry %s", it->path().string().c_str());
            continue;
        }
        SectionFileEntry entry;
        entry.index = index;
        entry.path = it->path().string();
        out->push_back(entry);
    }
    if (ec) {
        return base::setBpError(error, base::BpErrorCode::kIoFailure,
                                "failed to retrieve directory entry in " + inputDir + ": " + ec.message());
    }

    // 目录遍历顺序不可依赖，统一按编号升序。
    std::sort(out->begin(), out->end(), [](const SectionFileEntry& a, const SectionFileEntry& b) {
        return a.index < b.index;
    });
    return true;
}

}  // namespace bpk
