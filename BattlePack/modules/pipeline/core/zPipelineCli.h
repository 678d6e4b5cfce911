// 防止头文件重复包含。
#pragma once

// 引入字符串类型。
#include <string>

// 引入 pipeline 类型定义。
#include "zPipelineTypes.h"

// 进入 pipeline 命名空间。
namespace bpk {

// 解析子命令名到枚举值。
bool parseCommandValue(const std::string& value, BattlePackCommand* outCommand, std::string* error);
// 解析命令行参数并输出覆盖项。
bool parseCommandLine(int argc, char* argv[], CliOverrides& cli, std::string& error);
// 合并覆盖项并校验参数个数，得到最终配置。
bool buildConfig(const CliOverrides& cli, BattlePackConfig& config, std::string& error);
// 打印命令行帮助。
void printUsage();

// 结束命名空间。
}  // namespace bpk
