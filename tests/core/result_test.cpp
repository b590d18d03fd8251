#include "rus/core/error.hpp"
#include "rus/core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace rus;

namespace {

Result<int> half(int n) {
    if (n % 2 != 0) {
        return fail<int>(ErrorKind::Malformed, "odd: " + std::to_string(n));
    }
    return Ok(n / 2);
}

Result<void> check_positive(int n) {
    if (n <= 0) {
        return Err<void>(Error(ErrorKind::InvalidLength, "not positive"));
    }
    return Ok();
}

} // namespace

TEST(ResultTest, CarriesValueOrError) {
    auto ok = half(10);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_FALSE(ok.is_error());
    EXPECT_EQ(ok.value(), 5);

    auto bad = half(3);
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().kind, ErrorKind::Malformed);
    EXPECT_EQ(bad.error().message, "odd: 3");
    EXPECT_EQ(bad.value_or(-1), -1);
}

TEST(ResultTest, VoidResult) {
    EXPECT_TRUE(check_positive(1).is_ok());

    auto bad = check_positive(0);
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().kind, ErrorKind::InvalidLength);
}

TEST(ResultTest, ErrorCarriesProgress) {
    Error error(ErrorKind::Conflict, "offset mismatch");
    EXPECT_FALSE(error.offset.has_value());

    error.with_progress(40, 100);
    EXPECT_EQ(error.offset, 40u);
    EXPECT_EQ(error.length, 100u);

    Error deferred(ErrorKind::LengthRequired, "no length");
    deferred.with_progress(0, std::nullopt);
    EXPECT_EQ(deferred.offset, 0u);
    EXPECT_FALSE(deferred.length.has_value());
}

TEST(ResultTest, OnlyStorageUnavailableIsTransient) {
    EXPECT_TRUE(is_transient(ErrorKind::StorageUnavailable));
    EXPECT_FALSE(is_transient(ErrorKind::StorageFull));
    EXPECT_FALSE(is_transient(ErrorKind::ChecksumMismatch));
    EXPECT_STREQ(to_string(ErrorKind::StorageFull), "storage_full");
}
