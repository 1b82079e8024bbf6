#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include "../hash/digest.hpp"
#include "../source/byte_source.hpp"

namespace chunkstream
{
    // A full-size window cut while the source is still streaming.
    struct ChunkIntermediate
    {
        std::size_t index;
        Bytes bytes;
        std::string checksum; // SHA256 of `bytes` alone
    };

    // Always the last record: whatever is left (0 to chunkSize - 1 bytes)
    // plus the SHA256 of the whole stream.
    struct ChunkFinal
    {
        Bytes bytes;
        std::string fileChecksum;
    };

    using ChunkResult = std::variant<ChunkIntermediate, ChunkFinal>;

    // Splits a byte source into fixed-size checksummed chunks.
    //
    // Single pass: next() returns each intermediate chunk in index order, then
    // exactly one ChunkFinal, then std::nullopt. The source is closed once the
    // final record is produced, when the source fails (the error is rethrown),
    // or when the chunker is destroyed before reaching the end.
    class Chunker
    {
    public:
        Chunker(std::unique_ptr<ByteSource> source, std::size_t chunkSize);
        ~Chunker();

        Chunker(const Chunker &) = delete;
        Chunker &operator=(const Chunker &) = delete;
        Chunker(Chunker &&) = default;

        // readBlockSize 0 reads the file in chunkSize blocks; a value above
        // chunkSize is rejected with std::invalid_argument.
        static Chunker fromFile(const std::string &path, std::size_t chunkSize, std::size_t readBlockSize = 0);

        std::optional<ChunkResult> next();

        bool finished() const { return finished_; }

    private:
        std::size_t buffered() const { return pending_.size() - consumed_; }
        void append(const Bytes &block);
        ChunkIntermediate cutWindow();
        ChunkFinal finish();
        void release();

        std::unique_ptr<ByteSource> source_;
        std::size_t chunkSize_;
        RunningDigest fileDigest_;
        Bytes pending_;
        std::size_t consumed_ = 0;
        std::size_t nextIndex_ = 0;
        bool exhausted_ = false;
        bool finished_ = false;
    };
}
