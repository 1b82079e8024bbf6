#include "Chunker.hpp"
#include "../logger/Mylogger.hpp"
#include <stdexcept>
#include <utility>

namespace chunkstream
{
    Chunker::Chunker(std::unique_ptr<ByteSource> source, std::size_t chunkSize)
        : source_(std::move(source)), chunkSize_(chunkSize)
    {
        if (!source_)
        {
            throw std::invalid_argument("Chunker requires a byte source");
        }
        if (chunkSize_ == 0)
        {
            source_->close();
            throw std::invalid_argument("Chunk size must be positive");
        }
    }

    Chunker::~Chunker()
    {
        release();
    }

    Chunker Chunker::fromFile(const std::string &path, std::size_t chunkSize, std::size_t readBlockSize)
    {
        if (chunkSize == 0)
        {
            throw std::invalid_argument("Chunk size must be positive");
        }
        if (readBlockSize > chunkSize)
        {
            // A larger block would hold more than 2 * chunkSize - 1 bytes before the first cut
            throw std::invalid_argument("Read block size " + std::to_string(readBlockSize) +
                                        " exceeds chunk size " + std::to_string(chunkSize));
        }
        std::size_t blockSize = readBlockSize > 0 ? readBlockSize : chunkSize;
        return Chunker(std::make_unique<FileByteSource>(path, blockSize), chunkSize);
    }

    std::optional<ChunkResult> Chunker::next()
    {
        if (finished_)
        {
            return std::nullopt;
        }

        try
        {
            while (!exhausted_ && buffered() < chunkSize_)
            {
                Bytes block = source_->read();
                if (block.empty())
                {
                    exhausted_ = true;
                    break;
                }
                fileDigest_.update(block);
                append(block);
            }

            if (buffered() >= chunkSize_)
            {
                return cutWindow();
            }
            return finish();
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Chunking of " + source_->describe() + " aborted: " + e.what());
            finished_ = true;
            release();
            throw;
        }
        catch (...)
        {
            MyLogger::error("Chunking of " + source_->describe() + " aborted by an unknown error");
            finished_ = true;
            release();
            throw;
        }
    }

    void Chunker::append(const Bytes &block)
    {
        // Drop the already emitted prefix before growing the buffer
        if (consumed_ > 0)
        {
            pending_.erase(pending_.begin(), pending_.begin() + consumed_);
            consumed_ = 0;
        }
        pending_.insert(pending_.end(), block.begin(), block.end());
    }

    ChunkIntermediate Chunker::cutWindow()
    {
        auto first = pending_.begin() + consumed_;
        ChunkIntermediate chunk{nextIndex_, Bytes(first, first + chunkSize_), ""};
        consumed_ += chunkSize_;
        chunk.checksum = sha256Hex(chunk.bytes);

        MyLogger::debug("Chunk " + std::to_string(chunk.index) + " (" + std::to_string(chunk.bytes.size()) +
                        " bytes): " + chunk.checksum);
        nextIndex_++;
        return chunk;
    }

    ChunkFinal Chunker::finish()
    {
        ChunkFinal last{Bytes(pending_.begin() + consumed_, pending_.end()), fileDigest_.finalizeHex()};
        pending_.clear();
        consumed_ = 0;
        finished_ = true;
        release();

        MyLogger::info("Chunked " + source_->describe() + " into " + std::to_string(nextIndex_) +
                       " chunks plus " + std::to_string(last.bytes.size()) + " trailing bytes, checksum " +
                       last.fileChecksum);
        return last;
    }

    void Chunker::release()
    {
        if (source_ && source_->isOpen())
        {
            source_->close();
        }
    }
}
