#include "guestdrop/upload/gzip.hpp"
#include "support/gzip_util.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <string>

using guestdrop::ErrorKind;
using guestdrop::Ok;
using guestdrop::UploadResult;
using guestdrop::testing::bytes_of;
using guestdrop::testing::gzip;
using guestdrop::upload::ByteSink;
using guestdrop::upload::inflate_gzip;
using guestdrop::upload::is_gzip;

namespace {

ByteSink collect_into(std::string& out) {
    return [&out](const std::uint8_t* data, std::size_t size) -> UploadResult<void> {
        out.append(reinterpret_cast<const char*>(data), size);
        return Ok();
    };
}

} // namespace

TEST(GzipTest, DetectsMagic) {
    EXPECT_TRUE(is_gzip(gzip("hello")));
    EXPECT_FALSE(is_gzip(bytes_of("hello")));
    EXPECT_FALSE(is_gzip(std::vector<std::uint8_t>{0x1f}));
    EXPECT_FALSE(is_gzip({}));
}

TEST(GzipTest, MagicAloneIsNotEnough) {
    // Raw media can start with 1f 8b; the method byte and flags must match too.
    EXPECT_FALSE(is_gzip({0x1f, 0x8b, 0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07}));
    EXPECT_FALSE(is_gzip({0x1f, 0x8b, 0x08, 0x20, 0x00, 0x00, 0x00, 0x00, 0x00, 0x03}));
    EXPECT_FALSE(is_gzip({0x1f, 0x8b, 0x08, 0x00}));
    EXPECT_TRUE(is_gzip({0x1f, 0x8b, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x03}));
}

TEST(GzipTest, InflatesSingleMember) {
    const std::string plain(200000, 'z');
    std::string inflated;

    ASSERT_TRUE(inflate_gzip(gzip(plain), collect_into(inflated)).is_ok());
    EXPECT_EQ(inflated, plain);
}

TEST(GzipTest, InflatesConcatenatedMembers) {
    auto compressed = gzip("first part, ");
    const auto second = gzip("second part");
    compressed.insert(compressed.end(), second.begin(), second.end());

    std::string inflated;
    ASSERT_TRUE(inflate_gzip(compressed, collect_into(inflated)).is_ok());
    EXPECT_EQ(inflated, "first part, second part");
}

TEST(GzipTest, TruncatedStreamFails) {
    auto compressed = gzip(std::string(5000, 'q') + "tail");
    compressed.resize(compressed.size() / 2);

    std::string inflated;
    auto result = inflate_gzip(compressed, collect_into(inflated));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::AssemblyFailed);
}

TEST(GzipTest, TrailingGarbageFails) {
    auto compressed = gzip("payload");
    compressed.push_back('x');
    compressed.push_back('y');

    std::string inflated;
    auto result = inflate_gzip(compressed, collect_into(inflated));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::AssemblyFailed);
}

TEST(GzipTest, SinkErrorIsPassedThrough) {
    const ByteSink refuse = [](const std::uint8_t*, std::size_t) -> UploadResult<void> {
        return guestdrop::Err(guestdrop::UploadError::file_too_large("limit"));
    };

    auto result = inflate_gzip(gzip("anything"), refuse);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::FileTooLarge);
}
