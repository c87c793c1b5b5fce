// tests/test_layer1_base/test_result.cpp
/**
 * @file test_result.cpp
 * @brief Unit tests for testpipe::utils::Result.
 */
#include "tp_base.hpp"
#include "test_patterns.h"

#include <memory>
#include <type_traits>

using testpipe::utils::Result;

namespace
{

enum class ProbeError
{
    None,
    Missing,
    Broken,
};

using IntResult = Result<int, ProbeError>;

IntResult parse_digit(char c)
{
    if (c < '0' || c > '9')
        return IntResult::error(ProbeError::Broken, c);
    return IntResult::ok(c - '0');
}

} // namespace

static_assert(!std::is_copy_constructible_v<IntResult>);
static_assert(std::is_nothrow_move_constructible_v<IntResult>);

TEST(ResultTest, OkCarriesValue)
{
    auto r = parse_digit('7');
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_error());
    EXPECT_EQ(r.content(), 7);
    EXPECT_EQ(r.value_or(-1), 7);
}

TEST(ResultTest, ErrorCarriesEnumAndCode)
{
    auto r = parse_digit('x');
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), ProbeError::Broken);
    EXPECT_EQ(r.error_code(), 'x');
    EXPECT_EQ(r.value_or(-1), -1);
}

TEST(ResultTest, DefaultConstructedIsError)
{
    IntResult r;
    EXPECT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), ProbeError::None);
}

TEST(ResultTest, WrongAccessorThrowsLogicError)
{
    auto ok = parse_digit('1');
    auto bad = parse_digit('?');
    EXPECT_THROW((void)bad.content(), std::logic_error);
    EXPECT_THROW((void)ok.error(), std::logic_error);
    EXPECT_THROW((void)ok.error_code(), std::logic_error);
}

TEST(ResultTest, MoveOnlyPayloadCanBeTakenOut)
{
    auto r = Result<std::unique_ptr<int>, ProbeError>::ok(std::make_unique<int>(42));
    ASSERT_TRUE(r.is_ok());
    std::unique_ptr<int> p = std::move(r).content();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(*p, 42);
}
