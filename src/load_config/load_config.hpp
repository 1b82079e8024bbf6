#ifndef CHUNKSTREAM_LOAD_CONFIG_HPP
#define CHUNKSTREAM_LOAD_CONFIG_HPP

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "../logger/Mylogger.hpp"

namespace chunkstream
{
    using json = nlohmann::json;

    // Runtime settings for the chunkstream tool.
    struct Settings
    {
        std::size_t chunk_size = 1024 * 1024;
        std::size_t read_block_size = 0; // 0 means "same as chunk_size"
        std::string log_level = "info";
    };

    namespace ConfigReader
    {
        json load(const std::string &filepath);
        std::size_t get_config_size(const std::string &key, const json &j);
        std::string get_config_string(const std::string &key, const json &j);

        // Missing or invalid keys keep their default value.
        Settings loadSettings(const std::string &filepath);
    };
}

#endif // CHUNKSTREAM_LOAD_CONFIG_HPP
