// 防止头文件重复包含。
#pragma once

// 引入字符串类型。
#include <string>

// 引入 patch 摘要类型。
#include "zPipelineTypes.h"

// 进入 pipeline 命名空间。
namespace bpk {

// 原位修改容器：定位装备数组后，给每条装备记录置上“可攻击飞行单位”标志。
// 特征串未命中时返回 SignatureNotFound，文件不做任何修改。
bool patchFlyingFlag(const std::string& containerPath,
                     FlyingFlagPatchSummary* summary,
                     base::zBpError* error);

// 结束命名空间。
}  // namespace bpk
