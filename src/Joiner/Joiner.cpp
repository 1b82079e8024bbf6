#include "Joiner.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"
#include <algorithm>
#include <utility>

namespace chunkstream
{
    Joiner::Joiner(std::string expectedFileChecksum, std::vector<ChunkDescriptor> chunks)
        : expectedFileChecksum_(std::move(expectedFileChecksum)), chunks_(std::move(chunks))
    {
    }

    std::optional<JoinResult> Joiner::next()
    {
        if (finished_)
        {
            return std::nullopt;
        }

        try
        {
            if (!validated_)
            {
                validateOrder();
                validated_ = true;
            }
            if (position_ < chunks_.size())
            {
                return joinChunk(chunks_[position_++]);
            }
            return finish();
        }
        catch (const std::exception &e)
        {
            MyLogger::error(std::string("Join aborted: ") + e.what());
            finished_ = true;
            throw;
        }
        catch (...)
        {
            MyLogger::error("Join aborted by an unknown error");
            finished_ = true;
            throw;
        }
    }

    void Joiner::validateOrder()
    {
        std::stable_sort(chunks_.begin(), chunks_.end(),
                         [](const ChunkDescriptor &a, const ChunkDescriptor &b)
                         { return a.index < b.index; });

        for (std::size_t i = 0; i < chunks_.size(); i++)
        {
            if (chunks_[i].index != i)
            {
                throw InvalidChunkError("Missing chunk at index " + std::to_string(i), i);
            }
            if (!chunks_[i].accessor)
            {
                throw InvalidChunkError("Chunk at index " + std::to_string(i) + " has no byte accessor", i);
            }
        }
        MyLogger::debug("Joining " + std::to_string(chunks_.size()) + " chunks");
    }

    JoinIntermediate Joiner::joinChunk(const ChunkDescriptor &chunk)
    {
        std::optional<Bytes> bytes;
        try
        {
            bytes = chunk.accessor();
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Accessor for chunk " + std::to_string(chunk.index) + " failed: " + e.what());
            throw;
        }
        if (!bytes)
        {
            throw MissingChunkError(chunk.index);
        }

        std::string actual = sha256Hex(*bytes);
        if (actual != chunk.checksum)
        {
            throw InvalidChecksumError(chunk.index, chunk.checksum, actual);
        }

        fileDigest_.update(*bytes);
        manifest_.push_back({chunk.index, chunk.checksum});
        MyLogger::debug("Chunk " + std::to_string(chunk.index) + " verified (" + std::to_string(bytes->size()) + " bytes)");
        return JoinIntermediate{std::move(*bytes), chunk.checksum};
    }

    JoinFinal Joiner::finish()
    {
        std::string actual = fileDigest_.finalizeHex();
        if (actual != expectedFileChecksum_)
        {
            throw InvalidFinalChecksumError(expectedFileChecksum_, actual);
        }

        finished_ = true;
        MyLogger::info("Joined " + std::to_string(manifest_.size()) + " chunks, checksum " + actual);
        return JoinFinal{actual, std::move(manifest_)};
    }
}
