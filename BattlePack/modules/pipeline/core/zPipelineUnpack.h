// 防止头文件重复包含。
#pragma once

// 引入字符串类型。
#include <string>

// 引入错误模型。
#include "zError.h"

// 进入 pipeline 命名空间。
namespace bpk {

// 把容器中每个节导出为 outputDir/section_NN.bin；outputDir 不存在时递归创建。
// 任一节失败立即终止，并删除该节未写完的文件。
bool unpackBattlePack(const std::string& containerPath,
                      const std::string& outputDir,
                      base::zBpError* error);

// 结束命名空间。
}  // namespace bpk
