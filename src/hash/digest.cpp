#include "digest.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace chunkstream
{
    RunningDigest::RunningDigest() : ctx_(EVP_MD_CTX_new())
    {
        if (!ctx_)
        {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
        if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1)
        {
            throw std::runtime_error("Failed to initialize SHA-256 context");
        }
    }

    void RunningDigest::update(const std::uint8_t *data, std::size_t size)
    {
        if (finalized_)
        {
            throw std::logic_error("SHA-256 digest updated after finalization");
        }
        if (size == 0)
        {
            return;
        }
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1)
        {
            throw std::runtime_error("Failed to update SHA-256 hash");
        }
    }

    std::string RunningDigest::finalizeHex()
    {
        if (finalized_)
        {
            throw std::logic_error("SHA-256 digest finalized twice");
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLength = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), hash, &hashLength) != 1)
        {
            throw std::runtime_error("Failed to finalize SHA-256 hash");
        }
        finalized_ = true;

        std::stringstream ss;
        for (unsigned int i = 0; i < hashLength; i++)
        {
            ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        }
        return ss.str();
    }

    std::string sha256Hex(const std::uint8_t *data, std::size_t size)
    {
        RunningDigest digest;
        digest.update(data, size);
        return digest.finalizeHex();
    }

    std::string sha256Hex(const Bytes &data)
    {
        return sha256Hex(data.data(), data.size());
    }
}
