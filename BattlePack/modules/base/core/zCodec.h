// 防止头文件重复包含。
#pragma once

// 引入 size_t 定义。
#include <cstddef>
// 引入固定宽度整数类型。
#include <cstdint>
// 引入字节数组容器。
#include <vector>

// 基础层 little-endian 编解码工具命名空间。
namespace bpk::base::codec {

// 从字节数组按小端读取 u32。
bool readU32Le(const std::vector<uint8_t>& bytes, size_t offset, uint32_t* out);
// 末尾追加一个小端 u32。
void appendU32Le(std::vector<uint8_t>* out, uint32_t value);
// 把 u32 编码到 4 字节缓冲（流式写入场景使用）。
void encodeU32Le(uint32_t value, uint8_t out[4]);
// 从 cursor 位置读取 u32 并自动前移 cursor。
bool readU32LeAdvance(const std::vector<uint8_t>& bytes, size_t* cursor, uint32_t* out);

// 结束命名空间。
}  // namespace bpk::base::codec
