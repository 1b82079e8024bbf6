#include <gtest/gtest.h>

#include "hash/digest.hpp"

#include <stdexcept>
#include <string>

using namespace chunkstream;

namespace
{
    Bytes bytesOf(const std::string &text) { return Bytes(text.begin(), text.end()); }
}

TEST(DigestTest, EmptyInputMatchesKnownVector)
{
    EXPECT_EQ(sha256Hex(Bytes{}), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(DigestTest, AbcMatchesKnownVector)
{
    EXPECT_EQ(sha256Hex(bytesOf("abc")), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestTest, IncrementalUpdatesMatchOneShot)
{
    RunningDigest digest;
    digest.update(bytesOf("Hello, "));
    digest.update(Bytes{});
    digest.update(bytesOf("World!"));
    EXPECT_EQ(digest.finalizeHex(), sha256Hex(bytesOf("Hello, World!")));
}

TEST(DigestTest, OutputIsLowercaseHex)
{
    std::string hex = sha256Hex(bytesOf("chunk"));
    ASSERT_EQ(hex.size(), 64u);
    for (char c : hex)
    {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}

TEST(DigestTest, FinalizeIsTerminal)
{
    RunningDigest digest;
    digest.update(bytesOf("data"));
    EXPECT_FALSE(digest.finalized());
    digest.finalizeHex();
    EXPECT_TRUE(digest.finalized());
    EXPECT_THROW(digest.finalizeHex(), std::logic_error);
    EXPECT_THROW(digest.update(bytesOf("more")), std::logic_error);
}
