/*
 * [BPK_FLOW_NOTE] 文件级流程注释
 * - battle pack 随机访问读取器接口声明。
 * - 工具链位置：unpack 流程的数据源。
 * - 输入：容器文件路径或任意可 seek 的输入流。
 * - 输出：按索引流式导出的节数据。
 */
#ifndef BPK_CONTAINER_READER_H
#define BPK_CONTAINER_READER_H

#include "zError.h"
#include "zSectionTable.h"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace bpk::container {

/**
 * @brief battle pack 读取器。
 *
 * 打开时一次性解析节表；之后每次导出都重新 seek 到节起点，
 * 因此节可以任意顺序、任意次数导出，互不影响。
 */
class zContainerReader {
public:
    zContainerReader() = default;

    zContainerReader(const zContainerReader&) = delete;
    zContainerReader& operator=(const zContainerReader&) = delete;

    /**
     * @brief 打开容器文件并解析节表。
     * @return 路径不存在返回 NotFound；无法打开或节表头读失败返回 ContainerOpenFailure；
     *         节表非法返回 FormatError。
     */
    bool open(const std::string& path, base::zBpError* error);

    /**
     * @brief 接管一个已打开的输入流并解析节表（测试与内存数据使用）。
     * @param sourceName 仅用于日志与错误消息。
     */
    bool attach(std::unique_ptr<std::istream> stream, const std::string& sourceName, base::zBpError* error);

    // 是否已成功解析节表。
    bool isOpen() const { return stream_ != nullptr; }

    // 节数量：纯查询，不触发 IO。
    size_t sectionCount() const { return table_.size(); }

    // 查询节位置；越界返回 false。
    bool sectionEntry(size_t index, zSectionEntry* out) const { return table_.entry(index, out); }

    /**
     * @brief 把节 index 的字节完整写入 sink。
     * @param written [输出] 实际写入字节数（可选）。
     * @return 越界索引或节数据被截断返回 FormatError；sink 写失败返回 IOFailure。
     */
    bool extractSection(size_t index, std::ostream& sink, uint64_t* written, base::zBpError* error);

    /**
     * @brief 便捷接口：把节 index 读入字节数组。
     */
    bool readSection(size_t index, std::vector<uint8_t>* out, base::zBpError* error);

private:
    bool parseTable(base::zBpError* error);

    std::unique_ptr<std::istream> stream_;
    std::string source_name_;
    zSectionTable table_;
};

}  // namespace bpk::container

#endif // BPK_CONTAINER_READER_H
