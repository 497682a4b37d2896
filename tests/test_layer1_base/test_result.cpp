/**
 * @file test_result.cpp
 * @brief Layer 1 tests for utils::Result and utils::Status.
 */
#include "sd_base.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using syncdesk::utils::Result;
using syncdesk::utils::Status;

namespace
{

enum class LoadError
{
    None,
    Missing,
    Corrupt
};

struct RichError
{
    LoadError kind{LoadError::None};
    std::string detail;
};

Result<int, LoadError> parse_port(const std::string &s)
{
    if (s.empty())
        return Result<int, LoadError>::error(LoadError::Missing);
    try
    {
        return Result<int, LoadError>::ok(std::stoi(s));
    }
    catch (const std::exception &)
    {
        return Result<int, LoadError>::error(LoadError::Corrupt, 22);
    }
}

} // namespace

TEST(ResultTest, OkHoldsValue)
{
    auto r = parse_port("8080");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_error());
    EXPECT_EQ(r.content(), 8080);
    EXPECT_THROW((void)r.error(), std::logic_error);
    EXPECT_THROW((void)r.error_code(), std::logic_error);
}

TEST(ResultTest, ErrorHoldsKindAndCode)
{
    auto missing = parse_port("");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error(), LoadError::Missing);
    EXPECT_EQ(missing.error_code(), 0);

    auto corrupt = parse_port("eighty");
    EXPECT_EQ(corrupt.error(), LoadError::Corrupt);
    EXPECT_EQ(corrupt.error_code(), 22);
    EXPECT_THROW((void)corrupt.content(), std::logic_error);
}

TEST(ResultTest, DefaultConstructedIsValueInitializedError)
{
    Result<std::string, LoadError> r;
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), LoadError::None);
    EXPECT_EQ(r.error_code(), 0);
}

TEST(ResultTest, ValueOr)
{
    EXPECT_EQ(parse_port("443").value_or(80), 443);
    EXPECT_EQ(parse_port("").value_or(80), 80);
}

TEST(ResultTest, MoveOnlyContentMovesOut)
{
    auto r = Result<std::unique_ptr<int>, LoadError>::ok(std::make_unique<int>(5));
    std::unique_ptr<int> owned = std::move(r).content();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 5);
}

TEST(ResultTest, CloneIsIndependentCopy)
{
    auto original = Result<std::vector<int>, RichError>::ok({1, 2, 3});
    auto copy = original.clone();
    copy.content().push_back(4);
    EXPECT_EQ(original.content().size(), 3u);
    EXPECT_EQ(copy.content().size(), 4u);

    auto failed =
        Result<std::vector<int>, RichError>::error(RichError{LoadError::Corrupt, "bad header"}, 7);
    auto failed_copy = failed.clone();
    EXPECT_EQ(failed_copy.error().detail, "bad header");
    EXPECT_EQ(failed_copy.error_code(), 7);
}

TEST(ResultTest, StatusCarriesNoValue)
{
    auto done = Status<LoadError>::ok({});
    EXPECT_TRUE(done.is_ok());

    auto failed = Status<LoadError>::error(LoadError::Missing, 2);
    EXPECT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error_code(), 2);
}

TEST(ResultTest, MoveAssignmentReplacesState)
{
    auto r = parse_port("");
    r = parse_port("21");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.content(), 21);
}
