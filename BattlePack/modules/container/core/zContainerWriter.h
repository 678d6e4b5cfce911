/*
 * [BPK_FLOW_NOTE] 文件级流程注释
 * - battle pack 顺序写入器接口声明。
 * - 工具链位置：repack 流程的输出端。
 * - 输入：预先确定的节数量 + 按索引顺序提供的节数据。
 * - 输出：可被 zContainerReader 原样解析的容器。
 */
#ifndef BPK_CONTAINER_WRITER_H
#define BPK_CONTAINER_WRITER_H

#include "zError.h"
#include "zSectionTable.h"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

namespace bpk::container {

/**
 * @brief battle pack 写入器。
 *
 * 节数量在构造时固定。首次写入时先输出 count + 全 0 offset 占位表，
 * 之后每追加一节就回填它的 offset 槽位，数据紧跟在上一节之后。
 * sink 必须支持 seekp/tellp（文件流或字符串流）。
 */
class zContainerWriter {
public:
    zContainerWriter(std::ostream& sink, uint32_t sectionCount);

    zContainerWriter(const zContainerWriter&) = delete;
    zContainerWriter& operator=(const zContainerWriter&) = delete;

    /**
     * @brief 追加下一节（索引递增）。
     * @return 超过声明数量返回 ContractViolation 且不写入任何字节；sink 失败返回 IOFailure。
     */
    bool writeSection(const uint8_t* data, size_t size, base::zBpError* error);
    bool writeSection(const std::vector<uint8_t>& bytes, base::zBpError* error);

    /**
     * @brief 结束写入。
     * @return 已写节数与声明不一致返回 ContractViolation。
     */
    bool finish(base::zBpError* error);

    bool finished() const { return finished_; }

private:
    bool ensureHeader(base::zBpError* error);
    bool seekTo(uint64_t position, base::zBpError* error);

    std::ostream& sink_;
    zSectionTable table_;
    // header 在 sink 中的起始位置。
    std::streamoff base_ = 0;
    bool header_written_ = false;
    bool finished_ = false;
    // 出现过 IO 失败后拒绝继续写，避免生成半成品却报告成功。
    bool failed_ = false;
};

}  // namespace bpk::container

#endif // BPK_CONTAINER_WRITER_H
