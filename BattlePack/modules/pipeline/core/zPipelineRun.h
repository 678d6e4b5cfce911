// 防止头文件重复包含。
#pragma once

// 引入 pipeline 类型定义。
#include "zPipelineTypes.h"

// 进入 pipeline 命名空间。
namespace bpk {

// 按配置执行子命令；返回进程退出码（失败原因已写入日志）。
int runBattlePack(const BattlePackConfig& config);

// 结束命名空间。
}  // namespace bpk
