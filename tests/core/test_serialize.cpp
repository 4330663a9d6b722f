// SEALBID - Serialization Tests
// Copyright (c) 2024 SEALBID Developers
// MIT License

#include <gtest/gtest.h>

#include "sealbid/core/serialize.h"
#include "sealbid/core/types.h"

#include <optional>
#include <string>
#include <vector>

namespace sealbid {
namespace test {

// ============================================================================
// Integer Encoding
// ============================================================================

TEST(SerializeTest, Uint64LittleEndian) {
    DataStream ss;
    ss << uint64_t{0x0102030405060708ULL};
    EXPECT_EQ(ss.ToHex(), "0807060504030201");
    
    uint64_t value = 0;
    ss >> value;
    EXPECT_EQ(value, 0x0102030405060708ULL);
    EXPECT_TRUE(ss.empty());
}

TEST(SerializeTest, Uint64BigEndian) {
    DataStream ss;
    WriteBE<uint64_t>(ss, 1000);
    EXPECT_EQ(ss.ToHex(), "00000000000003e8");
    EXPECT_EQ(ReadBE<uint64_t>(ss), 1000u);
}

TEST(SerializeTest, Uint32) {
    DataStream ss;
    ss << uint32_t{0xdeadbeef};
    EXPECT_EQ(ss.ToHex(), "efbeadde");
}

TEST(SerializeTest, BoolCanonical) {
    DataStream ss;
    ss << true << false;
    EXPECT_EQ(ss.ToHex(), "0100");
    
    bool a = false, b = true;
    ss >> a >> b;
    EXPECT_TRUE(a);
    EXPECT_FALSE(b);
}

TEST(SerializeTest, BoolRejectsNonCanonical) {
    std::vector<uint8_t> raw = {0x02};
    DataStream ss(raw);
    bool value = false;
    EXPECT_THROW(ss >> value, std::ios_base::failure);
}

// ============================================================================
// CompactSize
// ============================================================================

TEST(SerializeTest, CompactSizeBoundaries) {
    struct Case { uint64_t value; const char* hex; };
    const Case cases[] = {
        {0, "00"},
        {252, "fc"},
        {253, "fdfd00"},
        {0xFFFF, "fdffff"},
        {0x10000, "fe00000100"},
    };
    for (const auto& c : cases) {
        DataStream ss;
        WriteCompactSize(ss, c.value);
        EXPECT_EQ(ss.ToHex(), c.hex) << c.value;
        EXPECT_EQ(ReadCompactSize(ss), c.value);
    }
}

TEST(SerializeTest, CompactSizeRejectsNonCanonical) {
    // 0xfd marker carrying a value below 253
    std::vector<uint8_t> raw = {0xfd, 0x10, 0x00};
    DataStream ss(raw);
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

TEST(SerializeTest, CompactSizeRejectsOversize) {
    DataStream ss;
    WriteCompactSize(ss, MAX_SIZE + 1);
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

// ============================================================================
// Strings, Vectors, Hashes, Optionals
// ============================================================================

TEST(SerializeTest, StringIsLengthPrefixed) {
    DataStream ss;
    ss << std::string("abc");
    EXPECT_EQ(ss.ToHex(), "03616263");
    
    std::string out;
    ss >> out;
    EXPECT_EQ(out, "abc");
}

TEST(SerializeTest, TruncatedStringThrows) {
    std::vector<uint8_t> raw = {0x05, 'a', 'b'};
    DataStream ss(raw);
    std::string out;
    EXPECT_THROW(ss >> out, std::ios_base::failure);
}

TEST(SerializeTest, HashIsRaw32Bytes) {
    std::vector<Byte> bytes(32, 0x7f);
    Hash256 h(bytes.data(), bytes.size());
    
    DataStream ss;
    ss << h;
    EXPECT_EQ(ss.size(), 32u);
    
    Hash256 out;
    ss >> out;
    EXPECT_EQ(out, h);
}

TEST(SerializeTest, OptionalPresenceFlag) {
    DataStream ss;
    ss << std::optional<uint64_t>{} << std::optional<uint64_t>{7};
    EXPECT_EQ(ss.ToHex(), "00" "01" "0700000000000000");
    
    std::optional<uint64_t> a{5}, b;
    ss >> a >> b;
    EXPECT_FALSE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, 7u);
}

TEST(SerializeTest, VectorOfStrings) {
    std::vector<std::string> in = {"x", "", "yz"};
    DataStream ss;
    ss << in;
    
    std::vector<std::string> out;
    ss >> out;
    EXPECT_EQ(out, in);
    EXPECT_TRUE(ss.empty());
}

TEST(SerializeTest, ReadPastEndThrows) {
    DataStream ss;
    uint32_t value = 0;
    EXPECT_THROW(ss >> value, std::ios_base::failure);
}

} // namespace test
} // namespace sealbid
