#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>

namespace chunkstream
{
    using Bytes = std::vector<std::uint8_t>;

    // Incremental SHA-256: update any number of times, finalize once.
    class RunningDigest
    {
    public:
        RunningDigest();

        RunningDigest(const RunningDigest &) = delete;
        RunningDigest &operator=(const RunningDigest &) = delete;
        RunningDigest(RunningDigest &&) = default;
        RunningDigest &operator=(RunningDigest &&) = default;

        void update(const std::uint8_t *data, std::size_t size);
        void update(const Bytes &data) { update(data.data(), data.size()); }

        // Returns the lowercase hex digest. Throws std::logic_error if called twice.
        std::string finalizeHex();

        bool finalized() const { return finalized_; }

    private:
        struct ContextDeleter
        {
            void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
        };

        std::unique_ptr<EVP_MD_CTX, ContextDeleter> ctx_;
        bool finalized_ = false;
    };

    std::string sha256Hex(const std::uint8_t *data, std::size_t size);
    std::string sha256Hex(const Bytes &data);
}
