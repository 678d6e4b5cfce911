/*
 * [BPK_FLOW_NOTE] 文件级流程注释
 * - battle pack 写入器实现。
 * - 布局：header(count + offset 占位表) -> 节 0 -> 节 1 -> ...，无对齐填充。
 */
#include "zContainerWriter.h"

#include "zCodec.h"
#include "zLog.h"

#include <string>

namespace bpk::container {

using base::BpErrorCode;

zContainerWriter::zContainerWriter(std::ostream& sink, const uint32_t sectionCount)
    : sink_(sink) {
    table_.reset(sectionCount);
}

bool zContainerWriter::seekTo(const uint64_t position, base::zBpError* error) {
    sink_.seekp(base_ + static_cast<std::streamoff>(position), std::ios::beg);
    if (!sink_) {
        failed_ = true;
        return base::setBpError(error, BpErrorCode::kIoFailure,
                                "failed to seek output to offset " + std::to_string(position));
    }
    return true;
}

bool zContainerWriter::ensureHeader(base::zBpError* error) {
    if (header_written_) {
        return true;
    }
    base_ = sink_.tellp();
    if (base_ < 0) {
        failed_ = true;
        return base::setBpError(error, BpErrorCode::kIoFailure, "output stream is not seekable");
    }
    // 先写占位表，数据区从表尾开始。
    std::vector<uint8_t> header;
    table_.serializeHeader(&header);
    sink_.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
    if (!sink_) {
        failed_ = true;
        return base::setBpError(error, BpErrorCode::kIoFailure, "failed to write section table");
    }
    header_written_ = true;
    return true;
}

bool zContainerWriter::writeSection(const uint8_t* data, const size_t size, base::zBpError* error) {
    if (finished_) {
        return base::setBpError(error, BpErrorCode::kContractViolation, "writer is already finished");
    }
    if (failed_) {
        return base::setBpError(error, BpErrorCode::kIoFailure, "writer is in a failed state");
    }
    if (data == nullptr && size != 0) {
        return base::setBpError(error, BpErrorCode::kContractViolation, "section data is null");
    }
    // 超量调用在输出任何字节前拒绝。
    if (table_.size() >= table_.declaredCount()) {
        return base::setBpError(error, BpErrorCode::kContractViolation,
                                "write_section called " + std::to_string(table_.size() + 1) +
                                " times but only " + std::to_string(table_.declaredCount()) +
                                " sections were declared");
    }
    if (!ensureHeader(error)) {
        return false;
    }

    const size_t index = table_.size();
    if (!table_.append(size, error)) {
        return false;
    }
    zSectionEntry entry;
    if (!table_.entry(index, &entry)) {
        return base::setBpError(error, BpErrorCode::kContractViolation,
                                "section " + std::to_string(index) + " was not registered");
    }

    // 回填 offset 槽位。
    uint8_t slot[kSectionOffsetFieldSize];
    base::codec::encodeU32Le(static_cast<uint32_t>(entry.offset), slot);
    if (!seekTo(zSectionTable::offsetSlotPosition(index), error)) {
        return false;
    }
    sink_.write(reinterpret_cast<const char*>(slot), static_cast<std::streamsize>(sizeof(slot)));
    if (!sink_) {
        failed_ = true;
        return base::setBpError(error, BpErrorCode::kIoFailure,
                                "failed to write table slot of section " + std::to_string(index));
    }

    // 回到数据区末尾追加节数据。
    if (!seekTo(entry.offset, error)) {
        return false;
    }
    if (size > 0) {
        sink_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!sink_) {
            failed_ = true;
            return base::setBpError(error, BpErrorCode::kIoFailure,
                                    "failed to write data of section " + std::to_string(index));
        }
    }
    LOGD("wrote section %zu: offset=%llu size=%zu",
         index,
         static_cast<unsigned long long>(entry.offset),
         size);
    base::clearBpError(error);
    return true;
}

bool zContainerWriter::writeSection(const std::vector<uint8_t>& bytes, base::zBpError* error) {
    return writeSection(bytes.data(), bytes.size(), error);
}

bool zContainerWriter::finish(base::zBpError* error) {
    if (finished_) {
        return true;
    }
    if (failed_) {
        return base::setBpError(error, BpErrorCode::kIoFailure, "writer is in a failed state");
    }
    if (table_.size() != table_.declaredCount()) {
        return base::setBpError(error, BpErrorCode::kContractViolation,
                                "declared " + std::to_string(table_.declaredCount()) +
                                " sections but wrote " + std::to_string(table_.size()));
    }
    // 0 节容器也要落一个 count 字段。
    if (!ensureHeader(error)) {
        return false;
    }
    sink_.flush();
    if (!sink_) {
        failed_ = true;
        return base::setBpError(error, BpErrorCode::kIoFailure, "failed to flush output");
    }
    finished_ = true;
    base::clearBpError(error);
    return true;
}

}  // namespace bpk::container
