#include <cstring>
#include <gtest/gtest.h>
#include <sift/crypto/hasher.h>

#include "../../common/test_helpers.h"

using namespace sift;
using namespace sift::crypto;

namespace {

constexpr const char* kEmptySha256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr const char* kAbcSha256 =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

std::vector<std::byte> bytesOf(const std::string& s) {
    std::vector<std::byte> out(s.size());
    std::memcpy(out.data(), s.data(), s.size());
    return out;
}

} // namespace

class SHA256HasherTest : public ::testing::Test {
protected:
    SHA256Hasher hasher;
};

TEST_F(SHA256HasherTest, KnownVectors) {
    hasher.init();
    EXPECT_EQ(hasher.finalize(), kEmptySha256);
    EXPECT_EQ(SHA256Hasher::hash(std::string_view{"abc"}), kAbcSha256);
}

TEST_F(SHA256HasherTest, StreamingMatchesOneShot) {
    auto data = bytesOf("Quarterly revenue grew across every region this year.");
    hasher.init();
    hasher.update(std::span<const std::byte>(data.data(), 10));
    hasher.update(std::span<const std::byte>(data.data() + 10, data.size() - 10));
    auto streamed = hasher.finalize();

    EXPECT_EQ(streamed, SHA256Hasher::hash(std::span<const std::byte>(data)));
    EXPECT_EQ(streamed.size(), 64u);
}

TEST_F(SHA256HasherTest, FinalizeResetsForReuse) {
    auto data = bytesOf("abc");
    hasher.update(std::span<const std::byte>(data));
    EXPECT_EQ(hasher.finalize(), kAbcSha256);
    hasher.update(std::span<const std::byte>(data));
    EXPECT_EQ(hasher.finalize(), kAbcSha256);
}

TEST_F(SHA256HasherTest, HashFile) {
    auto dir = tests::make_temp_dir("sift_hash_");
    auto path = tests::write_file(dir / "abc.txt", "abc");

    auto r = hasher.hashFile(path);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), kAbcSha256);

    auto missing = hasher.hashFile(dir / "missing.txt");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::FileNotFound);
    std::filesystem::remove_all(dir);
}
