// 防止头文件重复包含。
#pragma once

// 引入字符串类型。
#include <string>

// 引入错误模型。
#include "zError.h"

// 进入 pipeline 命名空间。
namespace bpk {

// 按编号升序读取 inputDir 下的 section_NN.bin，写出新容器 outputPath。
// 失败时删除未写完的 outputPath。
bool repackBattlePack(const std::string& inputDir,
                      const std::string& outputPath,
                      base::zBpError* error);

// 结束命名空间。
}  // namespace bpk
