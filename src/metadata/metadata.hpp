#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace chunkstream
{
    // One entry of a join manifest: which chunk was emitted, with which checksum.
    struct ChunkRecord
    {
        std::size_t index;    // Position of the chunk in the file
        std::string checksum; // SHA256 hash (hex)
    };

    inline bool operator==(const ChunkRecord &lhs, const ChunkRecord &rhs)
    {
        return lhs.index == rhs.index && lhs.checksum == rhs.checksum;
    }

    // Define how to serialize ChunkRecord to JSON
    inline void to_json(nlohmann::json &j, const ChunkRecord &record)
    {
        j = nlohmann::json{
            {"index", record.index},
            {"checksum", record.checksum}};
    }

    // Define how to deserialize JSON to ChunkRecord
    inline void from_json(const nlohmann::json &j, ChunkRecord &record)
    {
        j.at("index").get_to(record.index);
        j.at("checksum").get_to(record.checksum);
    }

    using Manifest = std::vector<ChunkRecord>;
}
