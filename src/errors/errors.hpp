#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace chunkstream
{
    // Base for every integrity failure raised by the joiner.
    class ChunkError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // The descriptor set is malformed (gap, duplicate, missing accessor).
    class InvalidChunkError : public ChunkError
    {
    public:
        InvalidChunkError(const std::string &message, std::size_t index);
        std::size_t index() const { return index_; }

    private:
        std::size_t index_;
    };

    class MissingChunkError : public ChunkError
    {
    public:
        explicit MissingChunkError(std::size_t index);
        std::size_t index() const { return index_; }

    private:
        std::size_t index_;
    };

    class InvalidChecksumError : public ChunkError
    {
    public:
        InvalidChecksumError(std::size_t index, const std::string &expected, const std::string &actual);
        std::size_t index() const { return index_; }
        const std::string &expected() const { return expected_; }
        const std::string &actual() const { return actual_; }

    private:
        std::size_t index_;
        std::string expected_;
        std::string actual_;
    };

    class InvalidFinalChecksumError : public ChunkError
    {
    public:
        InvalidFinalChecksumError(const std::string &expected, const std::string &actual);
        const std::string &expected() const { return expected_; }
        const std::string &actual() const { return actual_; }

    private:
        std::string expected_;
        std::string actual_;
    };
}
