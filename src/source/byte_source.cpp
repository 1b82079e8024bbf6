#include "byte_source.hpp"
#include "../logger/Mylogger.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace chunkstream
{
    FileByteSource::FileByteSource(const std::string &path, std::size_t blockSize)
        : path_(path), blockSize_(blockSize)
    {
        if (blockSize_ == 0)
        {
            throw std::invalid_argument("[FileByteSource] Block size must be positive");
        }
        file_.open(path_, std::ios::binary);
        if (!file_)
        {
            MyLogger::error("Failed to open file: " + path_);
            throw std::runtime_error("[FileByteSource] Failed to open file: " + path_);
        }
        MyLogger::debug("Opened " + describe() + " with block size " + std::to_string(blockSize_));
    }

    FileByteSource::~FileByteSource()
    {
        close();
    }

    Bytes FileByteSource::read()
    {
        if (!file_.is_open())
        {
            throw std::runtime_error("[FileByteSource] Read after close: " + path_);
        }

        Bytes block(blockSize_);
        file_.read(reinterpret_cast<char *>(block.data()), static_cast<std::streamsize>(blockSize_));
        if (file_.bad())
        {
            throw std::runtime_error("[FileByteSource] Read error: " + path_);
        }
        block.resize(static_cast<std::size_t>(file_.gcount()));
        return block;
    }

    void FileByteSource::close()
    {
        if (file_.is_open())
        {
            file_.close();
            MyLogger::debug("Closed " + describe());
        }
    }

    MemoryByteSource::MemoryByteSource(Bytes data, std::size_t blockSize)
        : data_(std::move(data)), blockSize_(blockSize)
    {
        if (blockSize_ == 0)
        {
            throw std::invalid_argument("[MemoryByteSource] Block size must be positive");
        }
    }

    Bytes MemoryByteSource::read()
    {
        if (!open_)
        {
            throw std::runtime_error("[MemoryByteSource] Read after close");
        }

        std::size_t size = std::min(blockSize_, data_.size() - offset_);
        Bytes block(data_.begin() + offset_, data_.begin() + offset_ + size);
        offset_ += size;
        return block;
    }

    void MemoryByteSource::close()
    {
        open_ = false;
    }

    std::string MemoryByteSource::describe() const
    {
        return "memory buffer of " + std::to_string(data_.size()) + " bytes";
    }
}
