// 防止头文件重复包含。
#pragma once

#include "zError.h"

#include <cstdint>
#include <string>
#include <vector>

// 基础层文件工具：只保留各流程实际用到的存在性判断、建目录与整文件读取。
namespace bpk::base::file {

// 路径存在且为普通文件（跟随符号链接）；目录、空路径一律视为不存在。
bool fileExists(const std::string& path);

// 确保目录存在，必要时递归创建；路径已被普通文件占用时返回 false。
bool ensureDirectory(const std::string& path);

/**
 * @brief 把整个节文件读入内存（repack 逐节读取输入使用）。
 * @return 打开、定长或读取失败返回 IOFailure，消息包含路径。
 */
bool readFileBytes(const std::string& path, std::vector<uint8_t>* out, zBpError* error);

}  // namespace bpk::base::file
