#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "../hash/digest.hpp"
#include "../metadata/metadata.hpp"

namespace chunkstream
{
    // Fetches the bytes of one chunk; std::nullopt means the data is missing.
    using ChunkAccessor = std::function<std::optional<Bytes>()>;

    struct ChunkDescriptor
    {
        std::size_t index;
        std::string checksum; // Declared SHA256 of the chunk bytes
        ChunkAccessor accessor;
    };

    struct JoinIntermediate
    {
        Bytes bytes;
        std::string checksum;
    };

    struct JoinFinal
    {
        std::string fileChecksum;
        Manifest sourceChunks; // Every emitted chunk, in emission order
    };

    using JoinResult = std::variant<JoinIntermediate, JoinFinal>;

    // Reassembles a set of chunks into the original byte stream.
    //
    // The first next() call sorts the descriptors and checks that their indices
    // form 0..count-1; otherwise InvalidChunkError is thrown before anything is
    // emitted. Each chunk is then fetched, verified and returned in index order.
    // MissingChunkError and InvalidChecksumError abort mid-stream, while
    // InvalidFinalChecksumError can only follow a fully verified set of chunks.
    // After a failure, or after the JoinFinal record, next() returns std::nullopt.
    class Joiner
    {
    public:
        Joiner(std::string expectedFileChecksum, std::vector<ChunkDescriptor> chunks);

        std::optional<JoinResult> next();

        bool finished() const { return finished_; }

    private:
        void validateOrder();
        JoinIntermediate joinChunk(const ChunkDescriptor &chunk);
        JoinFinal finish();

        std::string expectedFileChecksum_;
        std::vector<ChunkDescriptor> chunks_;
        RunningDigest fileDigest_;
        Manifest manifest_;
        std::size_t position_ = 0;
        bool validated_ = false;
        bool finished_ = false;
    };
}
