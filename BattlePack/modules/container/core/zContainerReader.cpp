/*
 * [BPK_FLOW_NOTE] 文件级流程注释
 * - battle pack 读取器实现：解析节表、按需流式导出节数据。
 * - 关键约束：
 *   1) 不读超过节声明长度的字节；
 *   2) 读到的字节少于声明长度时报错，不返回截短的节。
 */
#include "zContainerReader.h"

#include "zFile.h"
#include "zLog.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

namespace bpk::container {

using base::BpErrorCode;

namespace {

// 单次拷贝块大小：节可能很大，避免整节驻留内存。
constexpr size_t kCopyChunkSize = 64 * 1024;

}  // namespace

bool zContainerReader::open(const std::string& path, base::zBpError* error) {
    // 路径不存在与“存在但打不开”分开报告。
    if (!base::file::fileExists(path)) {
        return base::setBpError(error, BpErrorCode::kNotFound, "battle pack not found: " + path);
    }
    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*file) {
        return base::setBpError(error, BpErrorCode::kContainerOpenFailure,
                                "failed to open battle pack for reading: " + path);
    }
    return attach(std::move(file), path, error);
}

bool zContainerReader::attach(std::unique_ptr<std::istream> stream,
                              const std::string& sourceName,
                              base::zBpError* error) {
    stream_.reset();
    table_ = zSectionTable();
    source_name_ = sourceName;
    if (stream == nullptr) {
        return base::setBpError(error, BpErrorCode::kContractViolation, "reader stream is null");
    }
    stream_ = std::move(stream);
    if (!parseTable(error)) {
        // 解析失败时回到未打开状态。
        stream_.reset();
        return false;
    }
    LOGD("opened %s: sections=%zu", source_name_.c_str(), table_.size());
    base::clearBpError(error);
    return true;
}

bool zContainerReader::parseTable(base::zBpError* error) {
    std::istream& in = *stream_;

    // 获取容器总长度。
    in.clear();
    in.seekg(0, std::ios::end);
    const std::streamoff endPos = in.tellg();
    if (!in || endPos < 0) {
        return base::setBpError(error, BpErrorCode::kContainerOpenFailure,
                                "failed to determine size of " + source_name_);
    }
    const uint64_t fileSize = static_cast<uint64_t>(endPos);

    // 先读 count，确认 offset 表不超出文件后再分配缓冲。
    std::vector<uint8_t> header(kSectionCountFieldSize);
    in.seekg(0, std::ios::beg);
    in.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
    if (in.bad()) {
        return base::setBpError(error, BpErrorCode::kContainerOpenFailure,
                                "failed to read header of " + source_name_);
    }
    header.resize(static_cast<size_t>(in.gcount()));

    uint32_t count = 0;
    if (!zSectionTable::parseSectionCount(header, &count, error)) {
        return false;
    }
    const uint64_t tableEnd = zSectionTable::headerSizeFor(count);
    if (tableEnd > fileSize) {
        return base::setBpError(error, BpErrorCode::kFormatError,
                                source_name_ + ": section table of " + std::to_string(count) +
                                " entries runs past end of file (file size " + std::to_string(fileSize) + ")");
    }

    // 读取 offset 表剩余部分。
    const size_t tableBytes = static_cast<size_t>(tableEnd) - kSectionCountFieldSize;
    header.resize(static_cast<size_t>(tableEnd));
    if (tableBytes > 0) {
        in.read(reinterpret_cast<char*>(header.data() + kSectionCountFieldSize),
                static_cast<std::streamsize>(tableBytes));
        if (in.bad()) {
            return base::setBpError(error, BpErrorCode::kContainerOpenFailure,
                                    "failed to read section table of " + source_name_);
        }
        if (static_cast<size_t>(in.gcount()) != tableBytes) {
            return base::setBpError(error, BpErrorCode::kFormatError,
                                    source_name_ + ": section table is truncated");
        }
    }

    if (!table_.parse(header, fileSize, error)) {
        if (error != nullptr) {
            error->message = source_name_ + ": " + error->message;
        }
        return false;
    }
    return true;
}

bool zContainerReader::extractSection(const size_t index,
                                      std::ostream& sink,
                                      uint64_t* written,
                                      base::zBpError* error) {
    if (written != nullptr) {
        *written = 0;
    }
    if (!isOpen()) {
        return base::setBpError(error, BpErrorCode::kContractViolation, "reader is not open");
    }
    zSectionEntry entry;
    if (!table_.entry(index, &entry)) {
        return base::setBpError(error, BpErrorCode::kFormatError,
                                "section index " + std::to_string(index) + " is out of range (section count " +
                                std::to_string(table_.size()) + ")");
    }

    // 每次导出都重新定位到节起点，不依赖上一次调用留下的游标。
    std::istream& in = *stream_;
    in.clear();
    in.seekg(static_cast<std::streamoff>(entry.offset), std::ios::beg);
    if (!in) {
        return base::setBpError(error, BpErrorCode::kIoFailure,
                                "failed to seek to section " + std::to_string(index) + " at offset " +
                                std::to_string(entry.offset));
    }

    // 分块拷贝，缓冲不超过节长度。
    std::vector<char> buffer(static_cast<size_t>(std::min<uint64_t>(entry.length, kCopyChunkSize)));
    uint64_t remaining = entry.length;
    uint64_t copied = 0;
    while (remaining > 0) {
        const size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
        in.read(buffer.data(), static_cast<std::streamsize>(want));
        if (in.bad()) {
            return base::setBpError(error, BpErrorCode::kIoFailure,
                                    "read failure in section " + std::to_string(index));
        }
        const size_t got = static_cast<size_t>(in.gcount());
        if (got != want) {
            // 文件在打开后被截断：报错而不是返回短节。
            return base::setBpError(error, BpErrorCode::kFormatError,
                                    "section " + std::to_string(index) + " is truncated: expected " +
                                    std::to_string(entry.length) + " bytes, got " +
                                    std::to_string(copied + got));
        }
        // 写出本块；sink 失败属于 IO 错误而非格式错误。
        sink.write(buffer.data(), static_cast<std::streamsize>(got));
        if (!sink) {
            return base::setBpError(error, BpErrorCode::kIoFailure,
                                    "failed to write data of section " + std::to_string(index));
        }
        copied += got;
        remaining -= got;
    }

    if (written != nullptr) {
        *written = copied;
    }
    base::clearBpError(error);
    return true;
}

bool zContainerReader::readSection(const size_t index, std::vector<uint8_t>* out, base::zBpError* error) {
    if (out == nullptr) {
        return base::setBpError(error, BpErrorCode::kContractViolation, "section output is null");
    }
    out->clear();
    // 先导出到内存流，成功后一次性拷入输出数组。
    std::ostringstream sink(std::ios::binary);
    if (!extractSection(index, sink, nullptr, error)) {
        return false;
    }
    const std::string bytes = sink.str();
    out->assign(bytes.begin(), bytes.end());
    return true;
}

}  // namespace bpk::container
