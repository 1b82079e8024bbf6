#include "load_config.hpp"
#include <fstream>
#include <stdexcept>

namespace chunkstream
{
    namespace ConfigReader
    {
        json load(const std::string &filepath)
        {
            std::ifstream config_file(filepath);
            if (!config_file.is_open())
            {
                MyLogger::error("chunkstream settings file not readable: " + filepath);
                throw std::runtime_error("Could not open config file: " + filepath);
            }

            // A malformed file falls back to the built-in settings
            json settings = json::parse(config_file, nullptr, false);
            if (settings.is_discarded() || !settings.is_object())
            {
                MyLogger::error("Settings file " + filepath + " is not a JSON object, using defaults");
                return json::object();
            }

            MyLogger::info("Loaded chunkstream settings from " + filepath);
            MyLogger::debug("Settings: " + settings.dump());
            return settings;
        }

        std::size_t get_config_size(const std::string &key, const json &j)
        {
            if (!j.is_object() || !j.contains(key))
            {
                MyLogger::warning("Key not found in JSON: " + key);
                return 0;
            }
            if (!j[key].is_number_unsigned())
            {
                MyLogger::error("Key is not an unsigned integer: " + key);
                return 0;
            }
            return j[key].get<std::size_t>();
        }

        std::string get_config_string(const std::string &key, const json &j)
        {
            if (!j.is_object() || !j.contains(key))
            {
                MyLogger::warning("Key not found in JSON: " + key);
                return "";
            }
            if (!j[key].is_string())
            {
                MyLogger::error("Key is not a string: " + key);
                return "";
            }
            return j[key].get<std::string>();
        }

        Settings loadSettings(const std::string &filepath)
        {
            Settings settings;
            json j = load(filepath);

            if (std::size_t chunkSize = get_config_size("chunk_size", j); chunkSize > 0)
                settings.chunk_size = chunkSize;

            std::size_t blockSize = get_config_size("read_block_size", j);
            if (blockSize > settings.chunk_size)
            {
                MyLogger::error("read_block_size " + std::to_string(blockSize) + " exceeds chunk_size " +
                                std::to_string(settings.chunk_size) + ", reading in chunk_size blocks");
                blockSize = 0;
            }
            settings.read_block_size = blockSize;

            std::string level = get_config_string("log_level", j);
            if (!level.empty())
            {
                MyLogger::Level parsed = MyLogger::Level::Info;
                if (MyLogger::parseLevel(level, parsed))
                    settings.log_level = level;
                else
                    MyLogger::error("Unknown log level '" + level + "', keeping " + settings.log_level);
            }
            return settings;
        }
    }
}
