#include <gtest/gtest.h>
#include "migrator/core/result.h"
#include "migrator/core/error.h"
#include <memory>
#include <string>
#include <vector>

namespace migrator {
namespace core {
namespace {

TEST(ResultTest, SuccessConstruction) {
    Result<int> result(42);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorConstruction) {
    auto result = Result<int>::error("Invalid input", Error::Code::INVALID_ARGUMENT);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error(), "Invalid input");
    EXPECT_EQ(result.code(), Error::Code::INVALID_ARGUMENT);
}

TEST(ResultTest, DefaultErrorCodeIsInternal) {
    auto result = Result<std::string>::error("boom");
    EXPECT_EQ(result.code(), Error::Code::INTERNAL);
}

TEST(ResultTest, FromErrorObject) {
    Result<int> result{NotFoundError("no session")};
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), Error::Code::NOT_FOUND);
    EXPECT_EQ(result.error(), "no session");
}

TEST(ResultTest, VectorResult) {
    std::vector<int> vec = {1, 2, 3, 4, 5};
    Result<std::vector<int>> result(vec);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.value().size(), 5u);
}

TEST(ResultTest, MoveOnlyValue) {
    Result<std::unique_ptr<int>> result(std::make_unique<int>(7));
    ASSERT_TRUE(result.ok());
    std::unique_ptr<int> owned = result.take_value();
    ASSERT_TRUE(owned);
    EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, MoveConstruction) {
    Result<std::string> original("moved string");
    Result<std::string> moved(std::move(original));
    EXPECT_TRUE(moved.ok());
    EXPECT_EQ(moved.value(), "moved string");
}

TEST(ResultTest, VoidResult) {
    Result<void> result;
    EXPECT_TRUE(result.ok());
}

TEST(ResultTest, VoidErrorResult) {
    auto result = Result<void>::error("Deadline passed", Error::Code::TIMEOUT);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error(), "Deadline passed");
    EXPECT_EQ(result.code(), Error::Code::TIMEOUT);

    Result<void> copy = result;
    EXPECT_EQ(copy.code(), Error::Code::TIMEOUT);
}

TEST(ResultTest, ErrorOfOkResultThrows) {
    Result<int> result(1);
    EXPECT_THROW(result.error(), std::runtime_error);
}

} // namespace
} // namespace core
} // namespace migrator
