/*
 * [BPK_FLOW_NOTE] 文件级流程注释。
 * - 文件：container/format/zSectionTable.cpp
 * - 主要职责：节表解析/登记/序列化，所有字段宽度与位置都从本文件常量推导。
 */
#include "zSectionTable.h"

#include "zCodec.h"

#include <algorithm>
#include <string>

namespace bpk::container {

using base::BpErrorCode;

namespace {

// reset 时最多预留的条目数。
constexpr uint32_t kMaxReservedEntries = 4096;

}  // namespace

uint64_t zSectionTable::headerSizeFor(const uint64_t sectionCount) {
    return static_cast<uint64_t>(kSectionCountFieldSize) +
           sectionCount * static_cast<uint64_t>(kSectionOffsetFieldSize);
}

uint64_t zSectionTable::offsetSlotPosition(const size_t index) {
    return static_cast<uint64_t>(kSectionCountFieldSize) +
           static_cast<uint64_t>(index) * static_cast<uint64_t>(kSectionOffsetFieldSize);
}

bool zSectionTable::parseSectionCount(const std::vector<uint8_t>& countBytes,
                                      uint32_t* outCount,
                                      base::zBpError* error) {
    if (outCount == nullptr) {
        return base::setBpError(error, BpErrorCode::kContractViolation, "section count output is null");
    }
    if (!base::codec::readU32Le(countBytes, 0, outCount)) {
        return base::setBpError(error, BpErrorCode::kFormatError,
                                "container is shorter than the section count field");
    }
    return true;
}

bool zSectionTable::parse(const std::vector<uint8_t>& headerBytes,
                          const uint64_t fileSize,
                          base::zBpError* error) {
    // 失败时不保留半解析状态。
    entries_.clear();
    declared_count_ = 0;
    data_end_ = kSectionCountFieldSize;

    uint32_t count = 0;
    if (!parseSectionCount(headerBytes, &count, error)) {
        return false;
    }

    // offset 表必须完整落在头部字节与文件范围内。
    const uint64_t tableEnd = headerSizeFor(count);
    if (tableEnd > fileSize) {
        return base::setBpError(error, BpErrorCode::kFormatError,
                                "section table of " + std::to_string(count) +
                                " entries runs past end of file (file size " +
                                std::to_string(fileSize) + ")");
    }
    if (tableEnd > headerBytes.size()) {
        return base::setBpError(error, BpErrorCode::kFormatError,
                                "section table is truncated: need " + std::to_string(tableEnd) +
                                " bytes, have " + std::to_string(headerBytes.size()));
    }

    // 先读出全部 offset，再按相邻差推导长度。
    std::vector<uint64_t> offsets;
    offsets.reserve(count);
    size_t cursor = kSectionCountFieldSize;
    uint64_t previous = tableEnd;
    for (uint32_t i = 0; i < count; ++i) {
        uint32_t raw = 0;
        if (!base::codec::readU32LeAdvance(headerBytes, &cursor, &raw)) {
            return base::setBpError(error, BpErrorCode::kFormatError,
                                    "failed to read offset of section " + std::to_string(i));
        }
        const uint64_t offset = raw;
        // 节数据不能与头部重叠。
        if (offset < tableEnd) {
            return base::setBpError(error, BpErrorCode::kFormatError,
                                    "section " + std::to_string(i) + " offset " + std::to_string(offset) +
                                    " overlaps the section table (ends at " + std::to_string(tableEnd) + ")");
        }
        if (offset > fileSize) {
            return base::setBpError(error, BpErrorCode::kFormatError,
                                    "section " + std::to_string(i) + " offset " + std::to_string(offset) +
                                    " is past end of file (file size " + std::to_string(fileSize) + ")");
        }
        // 偏移单调不减，保证相邻节不重叠。
        if (offset < previous) {
            return base::setBpError(error, BpErrorCode::kFormatError,
                                    "section " + std::to_string(i) + " offset " + std::to_string(offset) +
                                    " precedes previous section offset " + std::to_string(previous));
        }
        offsets.push_back(offset);
        previous = offset;
    }

    entries_.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        const uint64_t end = (i + 1 < count) ? offsets[i + 1] : fileSize;
        zSectionEntry entry;
        entry.offset = offsets[i];
        entry.length = end - offsets[i];
        entries_.push_back(entry);
    }
    declared_count_ = count;
    data_end_ = count == 0 ? tableEnd : fileSize;
    return true;
}

void zSectionTable::reset(const uint32_t declaredCount) {
    declared_count_ = declaredCount;
    entries_.clear();
    // 声明数量来自调用方，预留上限避免超大 count 直接申请巨量内存。
    entries_.reserve(std::min<uint32_t>(declaredCount, kMaxReservedEntries));
    // 数据区紧跟 offset 表，不做对齐填充。
    data_end_ = headerSizeFor(declaredCount);
}

bool zSectionTable::append(const uint64_t length, base::zBpError* error) {
    if (entries_.size() >= declared_count_) {
        return base::setBpError(error, BpErrorCode::kContractViolation,
                                "section " + std::to_string(entries_.size()) +
                                " exceeds declared section count " + std::to_string(declared_count_));
    }
    // 起始偏移必须能放进 u32 字段。
    if (data_end_ > kMaxSectionOffset) {
        return base::setBpError(error, BpErrorCode::kFormatError,
                                "section " + std::to_string(entries_.size()) + " offset " +
                                std::to_string(data_end_) + " does not fit the 32-bit offset field");
    }
    zSectionEntry entry;
    entry.offset = data_end_;
    entry.length = length;
    entries_.push_back(entry);
    data_end_ += length;
    return true;
}

void zSectionTable::serializeHeader(std::vector<uint8_t>* out) const {
    if (out == nullptr) {
        return;
    }
    out->clear();
    out->reserve(static_cast<size_t>(headerSizeFor(declared_count_)));
    base::codec::appendU32Le(out, declared_count_);
    for (uint32_t i = 0; i < declared_count_; ++i) {
        // 未登记的槽位写 0 占位，由 writer 在追加对应节时回填。
        const uint32_t offset = i < entries_.size() ? static_cast<uint32_t>(entries_[i].offset) : 0U;
        base::codec::appendU32Le(out, offset);
    }
}

bool zSectionTable::entry(const size_t index, zSectionEntry* out) const {
    if (out == nullptr || index >= entries_.size()) {
        return false;
    }
    *out = entries_[index];
    return true;
}

}  // namespace bpk::container
