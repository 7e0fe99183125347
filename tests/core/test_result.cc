#include <gtest/gtest.h>

#include "chatws/core/result.h"

namespace chatws {
namespace {

Result<int> parsePositive(int value) {
  if (value <= 0) {
    return makeError<int>(ErrorCode::kInvalidArgument, "not positive");
  }
  return value;
}

TEST(ResultTest, SuccessCarriesValue) {
  auto result = parsePositive(3);
  ASSERT_TRUE(isSuccess(result));
  EXPECT_EQ(nullptr, getError(result));
  EXPECT_EQ(3, get<int>(result));
}

TEST(ResultTest, ErrorCarriesCodeAndMessage) {
  auto result = parsePositive(0);
  EXPECT_FALSE(isSuccess(result));
  auto* error = getError(result);
  ASSERT_NE(nullptr, error);
  EXPECT_EQ(ErrorCode::kInvalidArgument, error->code);
  EXPECT_EQ("not positive", error->message);
}

TEST(ResultTest, VoidResult) {
  VoidResult ok = makeVoidSuccess();
  EXPECT_TRUE(isSuccess(ok));

  VoidResult failed = makeVoidError(Error(ErrorCode::kNotConnected, "down"));
  EXPECT_FALSE(isSuccess(failed));
  ASSERT_NE(nullptr, getError(failed));
  EXPECT_EQ("down", getError(failed)->message);
}

}  // namespace
}  // namespace chatws
