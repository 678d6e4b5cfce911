// 防止头文件重复包含。
#pragma once

// 引入字符串类型。
#include <string>

// 基础层错误模型命名空间。
namespace bpk::base {

// 错误分类：调用方按 code 区分失败原因（退出码映射见 pipeline 层）。
enum class BpErrorCode {
    // 无错误。
    kNone = 0,
    // 输入容器/输入目录不存在。
    kNotFound = 1,
    // 底层读/写/seek/创建失败（磁盘、权限、流状态异常）。
    kIoFailure = 2,
    // 创建输出目录失败（IO 失败的一种，单独区分以便映射独立退出码）。
    kDirectoryFailure = 3,
    // 节表无法解析、内部不一致，或声明的节无法完整读出。
    kFormatError = 4,
    // 装备数组特征串未命中，patch 在改写任何字节前终止。
    kSignatureNotFound = 5,
    // 调用契约被违反（例如 writer 写入节数与声明不一致）。
    kContractViolation = 6,
    // 容器存在但无法打开，或节表头无法读出（与节数据读写失败区分退出码）。
    kContainerOpenFailure = 7,
};

// 统一错误载体：错误码 + 可读消息（包含出错的节/记录/路径）。
struct zBpError {
    BpErrorCode code = BpErrorCode::kNone;
    std::string message;
};

// 返回错误码的稳定名字（用于日志）。
const char* bpErrorCodeName(BpErrorCode code);

// 向可空的输出参数写入错误，并始终返回 false，便于 `return setBpError(...)`。
bool setBpError(zBpError* error, BpErrorCode code, const std::string& message);

// 清空错误输出（成功路径调用）。
void clearBpError(zBpError* error);

// 结束命名空间。
}  // namespace bpk::base
