#pragma once

#include <cstddef>
#include <fstream>
#include <string>
#include "../hash/digest.hpp"

namespace chunkstream
{
    // A sequential feed of byte blocks of arbitrary size.
    class ByteSource
    {
    public:
        virtual ~ByteSource() = default;

        // Next block; an empty block means the source is exhausted.
        // Throws std::runtime_error on I/O failure.
        virtual Bytes read() = 0;

        // Releases the underlying handle. Safe to call more than once.
        virtual void close() = 0;

        virtual bool isOpen() const = 0;

        // Used in log lines
        virtual std::string describe() const { return "<unknown source>"; }
    };

    class FileByteSource : public ByteSource
    {
    public:
        FileByteSource(const std::string &path, std::size_t blockSize);
        ~FileByteSource() override;

        Bytes read() override;
        void close() override;
        bool isOpen() const override { return file_.is_open(); }
        std::string describe() const override { return "file " + path_; }

    private:
        std::string path_;
        std::size_t blockSize_;
        std::ifstream file_;
    };

    class MemoryByteSource : public ByteSource
    {
    public:
        MemoryByteSource(Bytes data, std::size_t blockSize);

        Bytes read() override;
        void close() override;
        bool isOpen() const override { return open_; }
        std::string describe() const override;

    private:
        Bytes data_;
        std::size_t blockSize_;
        std::size_t offset_ = 0;
        bool open_ = true;
    };
}
