#include "guestdrop/core/error.hpp"
#include "guestdrop/core/result.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using guestdrop::Err;
using guestdrop::ErrorKind;
using guestdrop::Ok;
using guestdrop::Result;
using guestdrop::UploadError;
using guestdrop::UploadResult;

namespace {

struct Base {
    virtual ~Base() = default;
    virtual int id() const { return 1; }
};

struct Derived : Base {
    int id() const override { return 2; }
};

Result<int> parse_digit(char c) {
    if (c < '0' || c > '9') {
        return Err(std::string("not a digit"));
    }
    return Ok(c - '0');
}

} // namespace

TEST(ResultTest, HoldsValue) {
    auto result = parse_digit('7');
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.value(), 7);
}

TEST(ResultTest, HoldsError) {
    auto result = parse_digit('x');
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error(), "not a digit");
    EXPECT_EQ(result.value_or(-1), -1);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok = Ok();
    Result<void> failed = Err(std::string("nope"));

    EXPECT_TRUE(ok.is_ok());
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error(), "nope");
}

TEST(ResultTest, ConvertsDerivedPointerToBase) {
    Result<std::unique_ptr<Base>> result = Ok(std::make_unique<Derived>());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value()->id(), 2);
}

TEST(ResultTest, ConvertsStringLiteralError) {
    Result<int> result = Err("literal");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error(), "literal");
}

TEST(UploadErrorTest, KindNames) {
    EXPECT_EQ(guestdrop::to_string(ErrorKind::InvalidInput), "invalid_input");
    EXPECT_EQ(guestdrop::to_string(ErrorKind::SessionNotFound), "session_not_found");
    EXPECT_EQ(guestdrop::to_string(ErrorKind::IncompleteUpload), "incomplete_upload");
    EXPECT_EQ(guestdrop::to_string(ErrorKind::AssemblyFailed), "assembly_failed");
}

TEST(UploadErrorTest, ClientAndTerminalClassification) {
    EXPECT_TRUE(UploadError::invalid_input("x").is_client_error());
    EXPECT_TRUE(UploadError::file_too_large("x").is_client_error());
    EXPECT_TRUE(UploadError::incomplete({2}).is_client_error());
    EXPECT_FALSE(UploadError::incomplete({2}).is_terminal());

    EXPECT_FALSE(UploadError::assembly_failed("x").is_client_error());
    EXPECT_TRUE(UploadError::assembly_failed("x").is_terminal());
    EXPECT_TRUE(UploadError::storage_io("x").is_terminal());
}

TEST(UploadErrorTest, IncompleteCarriesMissingIndices) {
    UploadResult<int> result = Err(UploadError::incomplete({2, 5}));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::IncompleteUpload);
    EXPECT_EQ(result.error().missing, (std::vector<std::uint32_t>{2, 5}));
    EXPECT_NE(result.error().message.find("2 chunk"), std::string::npos);
}
