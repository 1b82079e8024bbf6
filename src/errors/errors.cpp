#include "errors.hpp"

namespace chunkstream
{
    InvalidChunkError::InvalidChunkError(const std::string &message, std::size_t index)
        : ChunkError(message), index_(index)
    {
    }

    MissingChunkError::MissingChunkError(std::size_t index)
        : ChunkError("Missing chunk at index " + std::to_string(index)), index_(index)
    {
    }

    InvalidChecksumError::InvalidChecksumError(std::size_t index, const std::string &expected, const std::string &actual)
        : ChunkError("Chunk at index " + std::to_string(index) + " has invalid checksum. Expected: " + expected + ", Got: " + actual),
          index_(index), expected_(expected), actual_(actual)
    {
    }

    InvalidFinalChecksumError::InvalidFinalChecksumError(const std::string &expected, const std::string &actual)
        : ChunkError("Final file checksum is invalid. Expected: " + expected + ", Got: " + actual),
          expected_(expected), actual_(actual)
    {
    }
}
