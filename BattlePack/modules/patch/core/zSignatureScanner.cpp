/*
 * [BPK_FLOW_NOTE] 文件级流程注释
 * - 字节特征串扫描器实现。
 * - 流程：回到流起点 -> 分块读取 -> 在“上块尾部 + 本块”窗口内查找 -> 丢弃不可能命中的前缀。
 * - 关键约束：窗口保留 signature.size()-1 字节，跨块边界的命中不会漏掉；
 *   命中位置与分块大小无关。
 */
#include "zSignatureScanner.h"

#include "zLog.h"

#include <algorithm>
#include <string>

namespace bpk::patch {

using base::BpErrorCode;

bool locateSignature(std::istream& stream,
                     const std::vector<uint8_t>& signature,
                     zSignatureMatch* out,
                     base::zBpError* error,
                     const size_t chunkSize) {
    // 参数校验：输出为空、特征串为空、块大小为 0 都是调用方错误。
    if (out == nullptr) {
        return base::setBpError(error, BpErrorCode::kContractViolation, "signature match output is null");
    }
    *out = zSignatureMatch();
    if (signature.empty()) {
        return base::setBpError(error, BpErrorCode::kContractViolation, "signature is empty");
    }
    if (chunkSize == 0) {
        return base::setBpError(error, BpErrorCode::kContractViolation, "scan chunk size is zero");
    }

    // 总是从流起点扫描，不依赖调用方留下的游标。
    stream.clear();
    stream.seekg(0, std::ios::beg);
    if (!stream) {
        return base::setBpError(error, BpErrorCode::kIoFailure, "failed to seek to start of stream");
    }

    // window = 上一块保留的尾部 + 本块新数据；windowStart 为 window[0] 的绝对偏移。
    const size_t keep = signature.size() - 1;
    std::vector<uint8_t> window;
    window.reserve(keep + chunkSize);
    uint64_t windowStart = 0;
    std::vector<char> chunk(chunkSize);

    while (true) {
        stream.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (stream.bad()) {
            return base::setBpError(error, BpErrorCode::kIoFailure,
                                    "read failure while scanning at offset " +
                                    std::to_string(windowStart + window.size()));
        }
        // 读到 0 字节说明流已耗尽。
        const size_t got = static_cast<size_t>(stream.gcount());
        if (got == 0) {
            break;
        }
        window.insert(window.end(),
                      reinterpret_cast<const uint8_t*>(chunk.data()),
                      reinterpret_cast<const uint8_t*>(chunk.data()) + got);

        const auto hit = std::search(window.begin(), window.end(), signature.begin(), signature.end());
        if (hit != window.end()) {
            out->found = true;
            out->offset = windowStart + static_cast<uint64_t>(hit - window.begin());
            LOGD("signature found at offset 0x%llx", static_cast<unsigned long long>(out->offset));
            base::clearBpError(error);
            return true;
        }

        // 只保留可能与下一块拼出命中的尾部。
        if (window.size() > keep) {
            const size_t drop = window.size() - keep;
            window.erase(window.begin(), window.begin() + static_cast<std::ptrdiff_t>(drop));
            windowStart += drop;
        }
        if (stream.eof()) {
            break;
        }
    }

    // 未命中是正常结果：found 保持 false，错误清空。
    base::clearBpError(error);
    return true;
}

}  // namespace bpk::patch
