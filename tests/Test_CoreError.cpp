#include <gtest/gtest.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

import Core;

TEST(CoreError, CodesHaveNames)
{
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::OutOfPoolMemory), "OutOfPoolMemory");
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::DeviceLost), "DeviceLost");
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::InvalidData), "InvalidData");
}

TEST(CoreError, OnlyDeviceLossIsFatal)
{
    EXPECT_TRUE(Core::IsFatal(Core::ErrorCode::DeviceLost));
    EXPECT_FALSE(Core::IsFatal(Core::ErrorCode::OutOfPoolMemory));
    EXPECT_FALSE(Core::IsFatal(Core::ErrorCode::InvalidData));
}

TEST(CoreError, ResultHelpers)
{
    const Core::Result ok = Core::Ok();
    EXPECT_TRUE(ok.has_value());

    const Core::Result failed = Core::Err(Core::ErrorCode::Unsupported);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error(), Core::ErrorCode::Unsupported);

    const Core::Expected<int> value = Core::Ok(5);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 5);
}

TEST(CoreHash, CombineIsOrderSensitive)
{
    EXPECT_EQ(Core::Hash::HashAll(1, 2u), Core::Hash::HashAll(1, 2u));
    EXPECT_NE(Core::Hash::HashAll(1, 2), Core::Hash::HashAll(2, 1));
}

TEST(CoreFilesystem, ReadWordsMissingFile)
{
    auto words = Core::Filesystem::ReadWords("/nonexistent/path/shader.spv");
    ASSERT_FALSE(words.has_value());
    EXPECT_EQ(words.error(), Core::ErrorCode::FileNotFound);
}

TEST(CoreFilesystem, ReadWordsRejectsPartialWord)
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "leasehold_partial.spv";
    {
        std::ofstream out(path, std::ios::binary);
        out.write("abcdef", 6);
    }

    auto words = Core::Filesystem::ReadWords(path);
    ASSERT_FALSE(words.has_value());
    EXPECT_EQ(words.error(), Core::ErrorCode::InvalidData);
    std::filesystem::remove(path);
}

TEST(CoreFilesystem, ReadWordsReadsWholeFile)
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "leasehold_words.spv";
    {
        const uint32_t data[2] = {0x07230203u, 42u};
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data), sizeof(data));
    }

    auto words = Core::Filesystem::ReadWords(path);
    ASSERT_TRUE(words.has_value());
    ASSERT_EQ(words->size(), 2u);
    EXPECT_EQ((*words)[0], 0x07230203u);
    EXPECT_EQ((*words)[1], 42u);
    std::filesystem::remove(path);
}
