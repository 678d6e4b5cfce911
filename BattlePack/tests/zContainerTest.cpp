#include "zContainerReader.h"
#include "zContainerWriter.h"

#include "zTestUtils.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <sstream>
#include <streambuf>
#include <string>
#include <utility>

using bpk::base::BpErrorCode;
using bpk::base::zBpError;
using bpk::container::zContainerReader;
using bpk::container::zContainerWriter;
using bpk::test::makeBytes;
using bpk::test::toBytes;
using bpk::test::toString;

namespace {

std::string writeContainer(const std::vector<std::vector<uint8_t>>& sections) {
    std::stringstream sink(std::ios::in | std::ios::out | std::ios::binary);
    zContainerWriter writer(sink, static_cast<uint32_t>(sections.size()));
    zBpError error;
    for (const auto& section : sections) {
        EXPECT_TRUE(writer.writeSection(section, &error)) << error.message;
    }
    EXPECT_TRUE(writer.finish(&error)) << error.message;
    return sink.str();
}

// 不支持定位的流：seekoff/seekpos 保持基类默认的失败返回，写入的字节直接丢弃。
class UnseekableBuf : public std::streambuf {
protected:
    int_type overflow(int_type c) override { return traits_type::not_eof(c); }
};

class UnseekableStream : public std::iostream {
public:
    UnseekableStream() : std::iostream(nullptr) { rdbuf(&buf_); }

private:
    UnseekableBuf buf_;
};

// 报告的长度比实际能读出的字节多：模拟打开后被截断的文件。
class ShortReadBuf : public std::streambuf {
public:
    ShortReadBuf(std::string data, std::streamoff claimedSize)
        : data_(std::move(data)), claimed_size_(claimedSize) {
        setg(data_.data(), data_.data(), data_.data() + data_.size());
    }

protected:
    pos_type seekoff(off_type off, std::ios_base::seekdir dir, std::ios_base::openmode which) override {
        off_type base = 0;
        if (dir == std::ios_base::cur) {
            base = virtual_pos_ >= 0 ? virtual_pos_ : gptr() - eback();
        } else if (dir == std::ios_base::end) {
            base = claimed_size_;
        }
        return seekpos(pos_type(base + off), which);
    }

    pos_type seekpos(pos_type pos, std::ios_base::openmode which) override {
        const off_type target = off_type(pos);
        if ((which & std::ios_base::in) == 0 || target < 0 || target > claimed_size_) {
            return pos_type(off_type(-1));
        }
        const off_type available = static_cast<off_type>(data_.size());
        // 定位到实际数据之外时记住逻辑位置，读取立即遇到 EOF。
        virtual_pos_ = target > available ? target : -1;
        setg(data_.data(), data_.data() + std::min(target, available), data_.data() + data_.size());
        return pos;
    }

private:
    std::string data_;
    std::streamoff claimed_size_;
    std::streamoff virtual_pos_ = -1;
};

class ShortReadStream : public std::istream {
public:
    ShortReadStream(std::string data, std::streamoff claimedSize)
        : std::istream(nullptr), buf_(std::move(data), claimedSize) {
        rdbuf(&buf_);
    }

private:
    ShortReadBuf buf_;
};

bool openReader(zContainerReader& reader, const std::string& bytes, zBpError* error) {
    return reader.attach(std::make_unique<std::stringstream>(bytes, std::ios::in | std::ios::binary),
                         "memory",
                         error);
}

}  // namespace

TEST(ContainerTest, RoundTripRecoversSectionsAndCount) {
    const std::vector<std::vector<uint8_t>> sections = {
        makeBytes(10, 1), {}, makeBytes(256, 2), makeBytes(1, 3), makeBytes(200000, 4)};
    const std::string container = writeContainer(sections);

    zContainerReader reader;
    zBpError error;
    ASSERT_TRUE(openReader(reader, container, &error)) << error.message;
    ASSERT_EQ(reader.sectionCount(), sections.size());
    for (size_t i = 0; i < sections.size(); ++i) {
        std::vector<uint8_t> data;
        ASSERT_TRUE(reader.readSection(i, &data, &error)) << error.message;
        EXPECT_EQ(data, sections[i]) << "section " << i;
    }
}

TEST(ContainerTest, WriterProducesExpectedLayout) {
    const std::string container = writeContainer({toBytes("abc"), {}, toBytes("de")});
    const std::string expected("\x03\x00\x00\x00"
                               "\x10\x00\x00\x00"
                               "\x13\x00\x00\x00"
                               "\x13\x00\x00\x00"
                               "abcde",
                               21);
    EXPECT_EQ(container, expected);
}

TEST(ContainerTest, ZeroSectionContainerIsCountOnly) {
    const std::string container = writeContainer({});
    EXPECT_EQ(container, std::string("\x00\x00\x00\x00", 4));

    zContainerReader reader;
    zBpError error;
    ASSERT_TRUE(openReader(reader, container, &error)) << error.message;
    EXPECT_EQ(reader.sectionCount(), 0u);
}

TEST(ContainerTest, ExtractIsRepeatableInAnyOrder) {
    const std::vector<std::vector<uint8_t>> sections = {makeBytes(33, 7), makeBytes(70000, 8), makeBytes(5, 9)};
    zContainerReader reader;
    zBpError error;
    ASSERT_TRUE(openReader(reader, writeContainer(sections), &error));

    for (size_t index : {2u, 0u, 1u, 2u, 1u}) {
        std::ostringstream sink(std::ios::binary);
        uint64_t written = 0;
        ASSERT_TRUE(reader.extractSection(index, sink, &written, &error)) << error.message;
        EXPECT_EQ(written, sections[index].size());
        EXPECT_EQ(sink.str(), toString(sections[index]));
    }
}

TEST(ContainerTest, OutOfRangeIndexIsRejected) {
    zContainerReader reader;
    zBpError error;
    ASSERT_TRUE(openReader(reader, writeContainer({toBytes("x")}), &error));

    std::ostringstream sink(std::ios::binary);
    uint64_t written = 99;
    EXPECT_FALSE(reader.extractSection(1, sink, &written, &error));
    EXPECT_EQ(error.code, BpErrorCode::kFormatError);
    EXPECT_EQ(written, 0u);
    EXPECT_TRUE(sink.str().empty());
}

TEST(ContainerTest, TruncatedTableIsFormatError) {
    std::string container = writeContainer({toBytes("hello"), toBytes("world")});
    container.resize(6);

    zContainerReader reader;
    zBpError error;
    EXPECT_FALSE(openReader(reader, container, &error));
    EXPECT_EQ(error.code, BpErrorCode::kFormatError);
    EXPECT_FALSE(reader.isOpen());
}

TEST(ContainerTest, EmptyStreamIsFormatError) {
    zContainerReader reader;
    zBpError error;
    EXPECT_FALSE(openReader(reader, std::string(), &error));
    EXPECT_EQ(error.code, BpErrorCode::kFormatError);
}

TEST(ContainerTest, WritingTooManySectionsIsContractViolation) {
    std::stringstream sink(std::ios::in | std::ios::out | std::ios::binary);
    zContainerWriter writer(sink, 1);
    zBpError error;
    ASSERT_TRUE(writer.writeSection(toBytes("one"), &error));
    const std::string before = sink.str();

    EXPECT_FALSE(writer.writeSection(toBytes("two"), &error));
    EXPECT_EQ(error.code, BpErrorCode::kContractViolation);
    EXPECT_EQ(sink.str(), before);
    EXPECT_TRUE(writer.finish(&error));
}

TEST(ContainerTest, FinishingEarlyIsContractViolation) {
    std::stringstream sink(std::ios::in | std::ios::out | std::ios::binary);
    zContainerWriter writer(sink, 3);
    zBpError error;
    ASSERT_TRUE(writer.writeSection(toBytes("one"), &error));
    EXPECT_FALSE(writer.finish(&error));
    EXPECT_EQ(error.code, BpErrorCode::kContractViolation);
    EXPECT_FALSE(writer.finished());
}

TEST(ContainerTest, OpenMissingFileIsNotFound) {
    zContainerReader reader;
    zBpError error;
    EXPECT_FALSE(reader.open("/nonexistent/dir/battle_pack.bin", &error));
    EXPECT_EQ(error.code, BpErrorCode::kNotFound);
}

TEST(ContainerTest, UnreadableContainerIsOpenFailure) {
    zContainerReader reader;
    zBpError error;
    EXPECT_FALSE(reader.attach(std::make_unique<UnseekableStream>(), "unseekable", &error));
    EXPECT_EQ(error.code, BpErrorCode::kContainerOpenFailure);
    EXPECT_FALSE(reader.isOpen());
}

TEST(ContainerTest, ExtractIntoFailingSinkIsIoFailure) {
    zContainerReader reader;
    zBpError error;
    ASSERT_TRUE(openReader(reader, writeContainer({toBytes("payload")}), &error)) << error.message;

    std::ostringstream sink(std::ios::binary);
    sink.setstate(std::ios::badbit);
    EXPECT_FALSE(reader.extractSection(0, sink, nullptr, &error));
    EXPECT_EQ(error.code, BpErrorCode::kIoFailure);
}

TEST(ContainerTest, SectionShorterThanDeclaredIsFormatError) {
    const std::string container = writeContainer({toBytes("hello"), toBytes("world")});
    ASSERT_EQ(container.size(), 22u);

    // 节表完整，但最后一节只剩 2 字节可读。
    zContainerReader reader;
    zBpError error;
    ASSERT_TRUE(reader.attach(std::make_unique<ShortReadStream>(container.substr(0, 19), 22), "short", &error))
        << error.message;
    ASSERT_EQ(reader.sectionCount(), 2u);

    std::vector<uint8_t> data;
    ASSERT_TRUE(reader.readSection(0, &data, &error)) << error.message;
    EXPECT_EQ(data, toBytes("hello"));

    std::ostringstream sink(std::ios::binary);
    EXPECT_FALSE(reader.extractSection(1, sink, nullptr, &error));
    EXPECT_EQ(error.code, BpErrorCode::kFormatError);
}

TEST(ContainerTest, WriterIntoFailingSinkIsIoFailure) {
    std::stringstream sink(std::ios::in | std::ios::out | std::ios::binary);
    sink.setstate(std::ios::badbit);
    zContainerWriter writer(sink, 1);
    zBpError error;
    EXPECT_FALSE(writer.writeSection(toBytes("data"), &error));
    EXPECT_EQ(error.code, BpErrorCode::kIoFailure);
    // 失败后不再接受写入。
    EXPECT_FALSE(writer.finish(&error));
    EXPECT_EQ(error.code, BpErrorCode::kIoFailure);
}

TEST(ContainerTest, WriterIntoUnseekableSinkIsIoFailure) {
    UnseekableStream sink;
    zContainerWriter writer(sink, 2);
    zBpError error;
    EXPECT_FALSE(writer.writeSection(toBytes("data"), &error));
    EXPECT_EQ(error.code, BpErrorCode::kIoFailure);
    EXPECT_FALSE(writer.finished());
}
