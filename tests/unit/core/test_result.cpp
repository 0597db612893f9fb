//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/result.hpp"
#include "cie/error.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace cie
{
    TEST(ResultTest, SuccessConstruction) {
        auto result = Result<std::size_t, Error>::success(3);

        EXPECT_TRUE(result.is_ok());
        EXPECT_FALSE(result.is_err());
        EXPECT_TRUE(static_cast<bool>(result));
        EXPECT_EQ(result.value(), 3u);
    }

    TEST(ResultTest, FailureConstruction) {
        auto result = Result<std::size_t, Error>::failure(Error::not_found("Unknown corpus", "kernel"));

        EXPECT_FALSE(result.is_ok());
        EXPECT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }

    TEST(ResultTest, DefaultErrorTypeIsError) {
        static_assert(std::is_same_v<Result<int>::error_type, Error>);
        const auto result = Result<int>::failure(Error::cancelled("stop"));
        EXPECT_EQ(result.error().code(), ErrorCode::Cancelled);
    }

    TEST(ResultTest, ValueThrowsOnError) {
        auto result = Result<int, Error>::failure(Error::invalid_argument("empty query"));
        EXPECT_THROW(result.value(), std::logic_error);
    }

    TEST(ResultTest, ErrorThrowsOnSuccess) {
        auto result = Result<int, Error>::success(10);
        EXPECT_THROW(result.error(), std::logic_error);
    }

    TEST(ResultTest, ValueOr) {
        const auto success = Result<int, Error>::success(7);
        const auto failure = Result<int, Error>::failure(Error::internal_error("oops"));

        EXPECT_EQ(success.value_or(0), 7);
        EXPECT_EQ(failure.value_or(0), 0);
    }

    TEST(ResultTest, MapOnSuccess) {
        const auto result = Result<std::vector<std::string>, Error>::success({"main", "init"});
        auto mapped = result.map([](const std::vector<std::string>& names) { return names.size(); });

        ASSERT_TRUE(mapped.is_ok());
        EXPECT_EQ(mapped.value(), 2u);
    }

    TEST(ResultTest, MapOnFailureKeepsError) {
        const auto result = Result<int, Error>::failure(Error::duplicate_symbol("twice", "a.rs:main"));
        auto mapped = result.map([](int x) { return x * 2; });

        ASSERT_TRUE(mapped.is_err());
        EXPECT_EQ(mapped.error().code(), ErrorCode::DuplicateSymbol);
        EXPECT_EQ(mapped.error().context().value(), "a.rs:main");
    }

    TEST(ResultTest, AndThenOnSuccess) {
        const auto result = Result<int, Error>::success(10);
        auto chained = result.and_then([](const int x) {
            return Result<std::string, Error>::success(std::to_string(x));
        });

        ASSERT_TRUE(chained.is_ok());
        EXPECT_EQ(chained.value(), "10");
    }

    TEST(ResultTest, AndThenOnFailureSkipsContinuation) {
        const auto result = Result<int, Error>::failure(Error::io_error("read failed", "x.c"));
        bool called = false;
        auto chained = result.and_then([&called](int x) {
            called = true;
            return Result<std::string, Error>::success(std::to_string(x));
        });

        EXPECT_TRUE(chained.is_err());
        EXPECT_FALSE(called);
    }

    TEST(ResultTest, OrElseRecovers) {
        const auto result = Result<int, Error>::failure(Error::not_found("missing"));
        auto recovered = result.or_else([](const Error&) {
            return Result<int, Error>::success(0);
        });

        ASSERT_TRUE(recovered.is_ok());
        EXPECT_EQ(recovered.value(), 0);
    }

    TEST(ResultTest, OrElseOnSuccessKeepsValue) {
        const auto result = Result<int, Error>::success(42);
        auto recovered = result.or_else([](const Error&) {
            return Result<int, Error>::success(0);
        });

        EXPECT_EQ(recovered.value(), 42);
    }

    TEST(ResultTest, MoveSemantics) {
        auto result = Result<std::string, Error>::success("fn_0123456789abcdef");
        const std::string value = std::move(result).value();

        EXPECT_EQ(value, "fn_0123456789abcdef");
    }

    TEST(VoidResultTest, SuccessAndFailure) {
        const auto ok = Result<void, Error>::success();
        EXPECT_TRUE(ok.is_ok());

        auto failed = Result<void, Error>::failure(Error::config_error("bad threshold"));
        EXPECT_TRUE(failed.is_err());
        EXPECT_EQ(failed.error().code(), ErrorCode::ConfigError);
    }

    TEST(VoidResultTest, AndThenRunsOnlyOnSuccess) {
        int counter = 0;
        const auto step = [&counter]() {
            ++counter;
            return Result<void, Error>::success();
        };

        EXPECT_TRUE((Result<void, Error>::success().and_then(step).is_ok()));
        EXPECT_TRUE((Result<void, Error>::failure(Error::cancelled("stop")).and_then(step).is_err()));
        EXPECT_EQ(counter, 1);
    }

}  // namespace cie
