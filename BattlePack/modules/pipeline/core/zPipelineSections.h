// 防止头文件重复包含。
#pragma once

// 引入固定宽度整数。
#include <cstdint>
// 引入字符串类型。
#include <string>
// 引入动态数组容器。
#include <vector>

// 引入错误模型。
#include "zError.h"

// 进入 pipeline 命名空间。
namespace bpk {

// 导出目录中的单个节文件。
struct SectionFileEntry {
    // 文件名中的节编号。
    uint32_t index = 0;
    // 完整路径。
    std::string path;
};

// 生成节文件名：section_<至少两位补零编号>.bin。
std::string sectionFileName(size_t index);
// 解析节文件名；只接受 `section_` + 两位数字 + `.bin`。
bool parseSectionFileName(const std::string& fileName, uint32_t* outIndex);
// 收集目录下（不递归）全部合法节文件，并按编号升序排列。
bool collectSectionFiles(const std::string& inputDir,
                         std::vector<SectionFileEntry>* out,
                         base::zBpError* error);

// 结束命名空间。
}  // namespace bpk
