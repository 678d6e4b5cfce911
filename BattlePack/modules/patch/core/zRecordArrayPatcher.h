/*
 * [BPK_FLOW_NOTE] 文件级流程注释
 * - 定长记录数组的位标志补丁接口声明。
 * - 工具链位置：patch 流程的写入步骤（特征串定位之后）。
 * - 输入：同时可读写的流 + 已定位的数组基址 + 记录布局。
 * - 输出：每条记录目标字节 |= mask，其余字节不动。
 */
#ifndef BPK_PATCH_RECORD_ARRAY_PATCHER_H
#define BPK_PATCH_RECORD_ARRAY_PATCHER_H

#include "zError.h"

#include <cstdint>
#include <iostream>

namespace bpk::patch {

// 定长记录数组中单个标志字段的布局。
struct zRecordArrayLayout {
    // 单条记录字节数（步长）。
    uint64_t stride = 0;
    // 标志字节在记录内的偏移，必须小于 stride。
    uint64_t fieldOffset = 0;
    // 记录条数。
    uint32_t count = 0;
    // 需要置位的比特。
    uint8_t mask = 0;
};

/**
 * @brief 对数组中每条记录执行 “读字节 -> 或上 mask -> 原位写回”。
 *
 * 只置位不清位，重复执行结果不变。逐条记录严格串行读改写。
 * 任意一条失败即整体失败，已写入的记录不回滚。
 *
 * @param arrayBase 数组首条记录的绝对偏移。
 * @param patched [输出] 成功处理的记录数（可选，失败时为失败前的数量）。
 * @return 越过文件末尾返回 FormatError；读写失败返回 IOFailure；布局非法返回 ContractViolation。
 */
bool setRecordFlagBits(std::iostream& stream,
                       uint64_t arrayBase,
                       const zRecordArrayLayout& layout,
                       uint32_t* patched,
                       base::zBpError* error);

}  // namespace bpk::patch

#endif // BPK_PATCH_RECORD_ARRAY_PATCHER_H
