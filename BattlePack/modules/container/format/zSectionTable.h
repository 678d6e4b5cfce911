/*
 * [BPK_FLOW_NOTE] 文件级流程注释。
 * - 文件：container/format/zSectionTable.h
 * - 主要职责：battle pack 节表模型，以及节表在磁盘上的编解码边界。
 * - 磁盘布局（全部小端）：
 *   [0, 4)              u32 section_count
 *   [4 + 4*i, 8 + 4*i)  u32 offset[i]（节 i 的绝对起始偏移）
 *   [4 + 4*count, ...)  各节数据首尾相接
 *   节 i 的长度 = offset[i+1] - offset[i]；最后一节延伸到文件末尾。
 * - 关键约束：
 *   1) 布局是游戏引擎读取的固定格式，只能在本文件的常量里描述，调用点不感知字段宽度。
 *   2) 偏移单调不减、不早于表尾、不超过文件长度，否则视为 FormatError。
 */
#ifndef BPK_CONTAINER_SECTION_TABLE_H
#define BPK_CONTAINER_SECTION_TABLE_H

#include "zError.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bpk::container {

// section_count 字段宽度。
constexpr size_t kSectionCountFieldSize = 4;
// 单个 offset 字段宽度。
constexpr size_t kSectionOffsetFieldSize = 4;
// offset 字段能表达的最大偏移。
constexpr uint64_t kMaxSectionOffset = 0xFFFFFFFFULL;

// 单个节在容器文件中的位置。
struct zSectionEntry {
    // 节数据绝对起始偏移。
    uint64_t offset = 0;
    // 节数据字节长度。
    uint64_t length = 0;
};

/**
 * @brief 节表模型：section 索引 -> (offset, length)。
 *
 * 两种构建方式：
 * - 读取端：`parse()` 一次性从头部字节解析；
 * - 写入端：`reset()` 声明节数后逐个 `append()`，offset 为累计值。
 */
class zSectionTable {
public:
    /**
     * @brief 计算给定节数时头部（count + offset 表）的总字节数。
     */
    static uint64_t headerSizeFor(uint64_t sectionCount);

    /**
     * @brief 返回节 i 的 offset 字段在文件中的位置。
     */
    static uint64_t offsetSlotPosition(size_t index);

    /**
     * @brief 仅解析头部前 4 字节中的 section_count。
     * @param countBytes 至少 4 字节的头部前缀。
     * @param outCount [输出] 节数量。
     * @param error [输出] 失败原因（可选）。
     */
    static bool parseSectionCount(const std::vector<uint8_t>& countBytes,
                                  uint32_t* outCount,
                                  base::zBpError* error);

    /**
     * @brief 从完整头部字节解析节表。
     * @param headerBytes 至少包含 count 与全部 offset 字段。
     * @param fileSize 容器文件总长度，用于推导最后一节长度并做越界校验。
     * @param error [输出] 失败原因（可选）。
     * @return true 表示节表合法；false 时模型被清空。
     */
    bool parse(const std::vector<uint8_t>& headerBytes, uint64_t fileSize, base::zBpError* error);

    /**
     * @brief 写入端：声明节数量并清空已登记的节。
     */
    void reset(uint32_t declaredCount);

    /**
     * @brief 写入端：登记下一节，offset 取当前数据区末尾。
     * @return 超出声明数量时返回 ContractViolation；offset 超出字段范围时返回 FormatError。
     */
    bool append(uint64_t length, base::zBpError* error);

    /**
     * @brief 序列化头部：声明数量 + 已登记节的 offset，未登记的槽位补 0。
     */
    void serializeHeader(std::vector<uint8_t>* out) const;

    // 声明的节数量（读取端等于解析出的数量）。
    uint32_t declaredCount() const { return declared_count_; }
    // 已登记的节数量。
    size_t size() const { return entries_.size(); }
    // 数据区末尾（即下一节的起始偏移）。
    uint64_t dataEnd() const { return data_end_; }

    /**
     * @brief 查询节位置。
     * @return 越界返回 false，不修改 out。
     */
    bool entry(size_t index, zSectionEntry* out) const;

private:
    uint32_t declared_count_ = 0;
    uint64_t data_end_ = kSectionCountFieldSize;
    std::vector<zSectionEntry> entries_;
};

}  // namespace bpk::container

#endif // BPK_CONTAINER_SECTION_TABLE_H
