// 引入小端编解码接口声明。
#include "zCodec.h"

namespace bpk::base::codec {

// 从 bytes[offset, offset+4) 读取小端 u32。
bool readU32Le(const std::vector<uint8_t>& bytes, const size_t offset, uint32_t* out) {
    // 输出指针不能为空，且读取区间不能越界（先比较再相加，避免 offset 溢出）。
    if (out == nullptr || offset > bytes.size() || bytes.size() - offset < 4) {
        return false;
    }
    *out = static_cast<uint32_t>(bytes[offset]) |
           (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 16) |
           (static_cast<uint32_t>(bytes[offset + 3]) << 24);
    return true;
}

// 在数组末尾追加一个小端 u32。
void appendU32Le(std::vector<uint8_t>* out, const uint32_t value) {
    if (out == nullptr) {
        return;
    }
    uint8_t raw[4];
    encodeU32Le(value, raw);
    out->insert(out->end(), raw, raw + 4);
}

void encodeU32Le(const uint32_t value, uint8_t out[4]) {
    // 低位在前。
    out[0] = static_cast<uint8_t>(value & 0xff);
    out[1] = static_cast<uint8_t>((value >> 8) & 0xff);
    out[2] = static_cast<uint8_t>((value >> 16) & 0xff);
    out[3] = static_cast<uint8_t>((value >> 24) & 0xff);
}

// 读取成功后 cursor 前移 4 字节；失败时 cursor 保持不变。
bool readU32LeAdvance(const std::vector<uint8_t>& bytes, size_t* cursor, uint32_t* out) {
    if (cursor == nullptr || !readU32Le(bytes, *cursor, out)) {
        return false;
    }
    *cursor += 4;
    return true;
}

}  // namespace bpk::base::codec
