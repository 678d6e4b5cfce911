/*
 * [BPK_FLOW_NOTE] 文件级流程注释
 * - 字节特征串扫描器接口声明。
 * - 工具链位置：patch 流程的结构发现步骤。
 * - 输入：可 seek 的输入流 + 非空特征串。
 * - 输出：首次命中的绝对偏移，或“未命中”。
 */
#ifndef BPK_PATCH_SIGNATURE_SCANNER_H
#define BPK_PATCH_SIGNATURE_SCANNER_H

#include "zError.h"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <vector>

namespace bpk::patch {

// 默认分块读取大小。
constexpr size_t kDefaultScanChunkSize = 64 * 1024;

// 扫描结果：未命中是正常结果，不是错误。
struct zSignatureMatch {
    bool found = false;
    // 命中时为特征串首字节相对流起点的偏移。
    uint64_t offset = 0;
};

/**
 * @brief 从流起点开始查找 signature 的第一次出现。
 *
 * 分块读取，块之间保留 signature.size()-1 字节重叠，
 * 跨块边界的命中同样能找到，结果与 chunkSize 无关。
 * 调用后流游标位置不做保证。
 *
 * @param out [输出] 扫描结果。
 * @return 流读失败返回 IOFailure；空特征串或 chunkSize 为 0 返回 ContractViolation。
 */
bool locateSignature(std::istream& stream,
                     const std::vector<uint8_t>& signature,
                     zSignatureMatch* out,
                     base::zBpError* error,
                     size_t chunkSize = kDefaultScanChunkSize);

}  // namespace bpk::patch

#endif // BPK_PATCH_SIGNATURE_SCANNER_H
