/*
 * [BPK_FLOW_NOTE] 文件级流程注释
 * - 定长记录数组的位标志补丁实现。
 * - 流程：量出流长度 -> 逐条记录 seek 读字节 -> 或上 mask -> 原位写回 -> flush。
 * - 越过流末尾按格式错误处理；seek/读/写本身失败按 IO 错误处理。
 */
#include "zRecordArrayPatcher.h"

#include "zLog.h"

#include <string>

namespace bpk::patch {

using base::BpErrorCode;

namespace {

// 量出流的总长度，读指针位置不保留。
bool measureStreamSize(std::iostream& stream, uint64_t* size, base::zBpError* error) {
    stream.clear();
    stream.seekg(0, std::ios::end);
    const std::streamoff end = stream.tellg();
    if (!stream || end < 0) {
        return base::setBpError(error, BpErrorCode::kIoFailure, "failed to measure stream size");
    }
    *size = static_cast<uint64_t>(end);
    return true;
}

} // namespace

bool setRecordFlagBits(std::iostream& stream,
                       const uint64_t arrayBase,
                       const zRecordArrayLayout& layout,
                       uint32_t* patched,
                       base::zBpError* error) {
    if (patched != nullptr) {
        *patched = 0;
    }
    // 布局校验：步长为 0 或字段越出记录都属于调用方错误。
    if (layout.stride == 0 || layout.fieldOffset >= layout.stride) {
        return base::setBpError(error, BpErrorCode::kContractViolation,
                                "invalid record layout: stride=" + std::to_string(layout.stride) +
                                " fieldOffset=" + std::to_string(layout.fieldOffset));
    }

    // 流长度只量一次，用于区分“越过末尾”和真正的 seek 失败。
    uint64_t streamSize = 0;
    if (!measureStreamSize(stream, &streamSize, error)) {
        return false;
    }

    for (uint32_t i = 0; i < layout.count; ++i) {
        const uint64_t position = arrayBase + static_cast<uint64_t>(i) * layout.stride + layout.fieldOffset;
        if (position >= streamSize) {
            return base::setBpError(error, BpErrorCode::kFormatError,
                                    "unexpected end of file at record " + std::to_string(i) + " (offset " +
                                    std::to_string(position) + ", size " + std::to_string(streamSize) + ")");
        }
        const std::streamoff pos = static_cast<std::streamoff>(position);

        // 读。
        stream.clear();
        stream.seekg(pos, std::ios::beg);
        if (!stream) {
            return base::setBpError(error, BpErrorCode::kIoFailure,
                                    "failed to seek to record " + std::to_string(i) + " at offset " +
                                    std::to_string(position));
        }
        const std::istream::int_type value = stream.get();
        if (stream.bad()) {
            return base::setBpError(error, BpErrorCode::kIoFailure,
                                    "failed to read record " + std::to_string(i) + " at offset " +
                                    std::to_string(position));
        }
        // 长度已校验过，这里仍读到 EOF 说明流在补丁过程中被截断。
        if (value == std::istream::traits_type::eof()) {
            return base::setBpError(error, BpErrorCode::kFormatError,
                                    "unexpected end of file at record " + std::to_string(i) + " (offset " +
                                    std::to_string(position) + ")");
        }

        // 改 + 写：同一位置原位写回。
        const uint8_t original = static_cast<uint8_t>(value);
        const uint8_t updated = static_cast<uint8_t>(original | layout.mask);
        stream.seekp(pos, std::ios::beg);
        stream.put(static_cast<char>(updated));
        if (!stream) {
            return base::setBpError(error, BpErrorCode::kIoFailure,
                                    "failed to write record " + std::to_string(i) + " at offset " +
                                    std::to_string(position));
        }
        LOGV("record %u @0x%llx: 0x%02x -> 0x%02x",
             i,
             static_cast<unsigned long long>(position),
             original,
             updated);
        if (patched != nullptr) {
            *patched = i + 1;
        }
    }

    // 全部记录写完后统一落盘。
    stream.flush();
    if (!stream) {
        return base::setBpError(error, BpErrorCode::kIoFailure, "failed to flush patched records");
    }
    base::clearBpError(error);
    return true;
}

}  // namespace bpk::patch
