#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "lcs/foundation/byte_buffer.hpp"

using namespace lcs::foundation;

TEST(ByteWriterTest, IntegersAreLittleEndian) {
    ByteWriter w;
    w.write<uint16_t>(0x0201).write<int32_t>(-2);

    const std::vector<uint8_t> expected = {0x01, 0x02, 0xFE, 0xFF, 0xFF, 0xFF};
    EXPECT_EQ(w.bytes(), expected);
}

TEST(ByteWriterTest, StringsAreLengthPrefixed) {
    ByteWriter w;
    w.writeString("map");

    const std::vector<uint8_t> expected = {3, 0, 0, 0, 'm', 'a', 'p'};
    EXPECT_EQ(w.bytes(), expected);
}

TEST(ByteReaderTest, ReadsWhatWasWritten) {
    ByteWriter w;
    w.write<uint64_t>(42).write(true).writeString("arena2").write<uint16_t>(7777);
    auto bytes = std::move(w).bytes();

    ByteReader r{bytes};
    uint64_t peer = 0;
    bool flag = false;
    std::string name;
    uint16_t port = 0;
    ASSERT_TRUE(r.read(peer));
    ASSERT_TRUE(r.read(flag));
    ASSERT_TRUE(r.readString(name));
    ASSERT_TRUE(r.read(port));
    EXPECT_TRUE(r.atEnd());

    EXPECT_EQ(peer, 42u);
    EXPECT_TRUE(flag);
    EXPECT_EQ(name, "arena2");
    EXPECT_EQ(port, 7777);
}

TEST(ByteReaderTest, TruncatedIntegerFailsWithoutAdvancing) {
    const std::vector<uint8_t> bytes = {0x01, 0x02};
    ByteReader r{bytes};
    uint32_t value = 99;
    EXPECT_FALSE(r.read(value));
    EXPECT_EQ(value, 99u);
    EXPECT_EQ(r.pos, 0u);
}

TEST(ByteReaderTest, OversizedStringLengthFailsAndRewinds) {
    const std::vector<uint8_t> bytes = {0xFF, 0xFF, 0xFF, 0x7F, 'a'};
    ByteReader r{bytes};
    std::string s;
    EXPECT_FALSE(r.readString(s));
    EXPECT_EQ(r.pos, 0u);
    EXPECT_TRUE(s.empty());
}
