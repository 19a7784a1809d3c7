#include <gtest/gtest.h>
#include <sift/storage/content_source.h>

#include "../../common/test_helpers.h"

#include <sstream>

using namespace sift;
using namespace sift::storage;

namespace {

// Wraps a stringbuf but refuses to seek, like a pipe or network stream
class NonSeekableBuf : public std::stringbuf {
public:
    explicit NonSeekableBuf(const std::string& s) : std::stringbuf(s) {}

protected:
    pos_type seekoff(off_type, std::ios_base::seekdir, std::ios_base::openmode) override {
        return pos_type(off_type(-1));
    }
    pos_type seekpos(pos_type, std::ios_base::openmode) override { return pos_type(off_type(-1)); }
};

std::string asString(const ByteVector& bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

} // namespace

class LocalContentSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = tests::make_temp_dir("sift_content_");
        tests::write_file(root_ / "docs" / "a.txt", "alpha");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path root_;
};

TEST_F(LocalContentSourceTest, OpensLogicalPaths) {
    LocalContentSource source(root_);
    auto stream = source.open("docs/a.txt");
    ASSERT_TRUE(stream);
    auto bytes = bufferStream(*stream.value());
    ASSERT_TRUE(bytes);
    EXPECT_EQ(asString(bytes.value()), "alpha");

    auto viaBackslash = source.exists("\\docs\\a.txt");
    ASSERT_TRUE(viaBackslash);
    EXPECT_TRUE(viaBackslash.value());
}

TEST_F(LocalContentSourceTest, MissingFile) {
    LocalContentSource source(root_);
    auto exists = source.exists("/docs/missing.txt");
    ASSERT_TRUE(exists);
    EXPECT_FALSE(exists.value());

    auto stream = source.open("/docs/missing.txt");
    ASSERT_FALSE(stream);
    EXPECT_EQ(stream.error().code, ErrorCode::FileNotFound);
}

TEST_F(LocalContentSourceTest, RejectsPathsEscapingRoot) {
    LocalContentSource source(root_ / "docs");
    auto r = source.resolve("/../secret.txt");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(BufferStreamTest, NonSeekableStreamIsDrained) {
    std::string payload(DEFAULT_BUFFER_SIZE * 2 + 17, 'x');
    NonSeekableBuf buf(payload);
    std::istream in(&buf);
    auto bytes = bufferStream(in);
    ASSERT_TRUE(bytes);
    EXPECT_EQ(bytes.value().size(), payload.size());
}

TEST(BufferStreamTest, LimitIsEnforced) {
    std::istringstream seekable(std::string(100, 'y'));
    auto r = bufferStream(seekable, 10);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ResourceExhausted);

    NonSeekableBuf buf(std::string(100, 'z'));
    std::istream in(&buf);
    auto drained = bufferStream(in, 10);
    ASSERT_FALSE(drained);
    EXPECT_EQ(drained.error().code, ErrorCode::ResourceExhausted);

    std::istringstream small("ok");
    auto fits = bufferStream(small, 10);
    ASSERT_TRUE(fits);
    EXPECT_EQ(asString(fits.value()), "ok");
}
