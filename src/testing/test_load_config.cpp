#include <gtest/gtest.h>

#include "load_config/load_config.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace chunkstream;

namespace
{
    fs::path writeConfig(const std::string &name, const std::string &body)
    {
        fs::path path = fs::temp_directory_path() / name;
        std::ofstream out(path, std::ios::trunc);
        out << body;
        return path;
    }
}

TEST(LoadConfigTest, ReadsAllSettings)
{
    fs::path path = writeConfig("chunkstream_config_full.json",
                                R"({"chunk_size": 4096, "read_block_size": 512, "log_level": "warning"})");
    Settings settings = ConfigReader::loadSettings(path.string());

    EXPECT_EQ(settings.chunk_size, 4096u);
    EXPECT_EQ(settings.read_block_size, 512u);
    EXPECT_EQ(settings.log_level, "warning");
    fs::remove(path);
}

TEST(LoadConfigTest, MissingOrInvalidKeysKeepDefaults)
{
    fs::path path = writeConfig("chunkstream_config_partial.json",
                                R"({"chunk_size": "big", "log_level": "loud"})");
    Settings settings = ConfigReader::loadSettings(path.string());

    Settings defaults;
    EXPECT_EQ(settings.chunk_size, defaults.chunk_size);
    EXPECT_EQ(settings.read_block_size, 0u);
    EXPECT_EQ(settings.log_level, defaults.log_level);
    fs::remove(path);
}

TEST(LoadConfigTest, OversizedReadBlockIsDropped)
{
    fs::path path = writeConfig("chunkstream_config_block.json",
                                R"({"chunk_size": 1000, "read_block_size": 10000})");
    Settings settings = ConfigReader::loadSettings(path.string());

    EXPECT_EQ(settings.chunk_size, 1000u);
    EXPECT_EQ(settings.read_block_size, 0u);
    fs::remove(path);
}

TEST(LoadConfigTest, MalformedJsonYieldsDefaults)
{
    fs::path path = writeConfig("chunkstream_config_broken.json", "{ not json");
    Settings settings = ConfigReader::loadSettings(path.string());
    EXPECT_EQ(settings.chunk_size, Settings{}.chunk_size);
    fs::remove(path);
}

TEST(LoadConfigTest, MissingFileThrows)
{
    fs::path path = fs::temp_directory_path() / "chunkstream_config_missing.json";
    fs::remove(path);
    EXPECT_THROW(ConfigReader::load(path.string()), std::runtime_error);
}

TEST(LoadConfigTest, TypedGettersFallBack)
{
    json j = {{"size", 12u}, {"name", "abc"}, {"negative", -3}};
    EXPECT_EQ(ConfigReader::get_config_size("size", j), 12u);
    EXPECT_EQ(ConfigReader::get_config_size("negative", j), 0u);
    EXPECT_EQ(ConfigReader::get_config_size("absent", j), 0u);
    EXPECT_EQ(ConfigReader::get_config_string("name", j), "abc");
    EXPECT_EQ(ConfigReader::get_config_string("size", j), "");
}
