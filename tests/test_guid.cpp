#include <gtest/gtest.h>
#include "crypto/guid.hpp"
#include "scripted_byte_source.hpp"
#include <cctype>
#include <set>

using namespace padlock;
using namespace padlock::crypto;
using padlock::test_support::ScriptedByteSource;

TEST(GuidGeneratorTest, Shape) {
    GuidGenerator generator;

    for (int i = 0; i < 1000; ++i) {
        auto guid = generator.generate();
        ASSERT_EQ(guid.size(), constants::GUID_HEX_LENGTH);
        for (char c : guid) {
            ASSERT_TRUE(std::isxdigit(static_cast<unsigned char>(c))) << guid;
            ASSERT_FALSE(std::isupper(static_cast<unsigned char>(c))) << guid;
        }
    }
}

TEST(GuidGeneratorTest, LargeSampleHasNoDuplicates) {
    GuidGenerator generator;
    std::set<std::string> seen;

    for (int i = 0; i < 10000; ++i) {
        seen.insert(generator.generate());
    }
    EXPECT_EQ(seen.size(), 10000u);
}

TEST(GuidGeneratorTest, RendersSourceBytesAsHex) {
    bytes script(constants::GUID_SIZE);
    for (size_t i = 0; i < script.size(); ++i) {
        script[i] = static_cast<byte>(i * 5);
    }
    ScriptedByteSource source(script);
    GuidGenerator generator(source);

    auto guid = generator.generate();

    EXPECT_EQ(guid, bytes_to_hex(script));
    EXPECT_EQ(guid.substr(0, 8), "00050a0f");
    EXPECT_EQ(source.remaining(), 0u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
