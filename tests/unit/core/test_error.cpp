//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/error.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace cie
{
    TEST(ErrorTest, BasicConstruction) {
        const Error error(ErrorCode::InvalidArgument, "empty query");

        EXPECT_EQ(error.code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(error.message(), "empty query");
        EXPECT_FALSE(error.has_context());
    }

    TEST(ErrorTest, ConstructionWithContext) {
        const Error error(ErrorCode::NotFound, "unknown file", "src/irq.c");

        EXPECT_EQ(error.code(), ErrorCode::NotFound);
        EXPECT_TRUE(error.has_context());
        EXPECT_EQ(error.context().value(), "src/irq.c");
    }

    TEST(ErrorTest, DuplicateSymbolCarriesRegistryKey) {
        const auto error = Error::duplicate_symbol("Function defined twice", "src/a.rs:main");
        EXPECT_EQ(error.code(), ErrorCode::DuplicateSymbol);
        EXPECT_EQ(error.context().value(), "src/a.rs:main");
    }

    TEST(ErrorTest, CacheCorruptedCarriesKey) {
        const auto error = Error::cache_corrupted("Hash mismatch", "src/b.c");
        EXPECT_EQ(error.code(), ErrorCode::CacheCorrupted);
        EXPECT_EQ(error.context().value(), "src/b.c");
    }

    TEST(ErrorTest, CancelledHasNoContext) {
        const auto error = Error::cancelled("Batch cancelled");
        EXPECT_EQ(error.code(), ErrorCode::Cancelled);
        EXPECT_FALSE(error.has_context());
    }

    TEST(ErrorTest, ConfigErrorFactory) {
        const auto error = Error::config_error("bad regex", "linker.entry_point_patterns");
        EXPECT_EQ(error.code(), ErrorCode::ConfigError);
        EXPECT_EQ(error.context().value(), "linker.entry_point_patterns");
    }

    TEST(ErrorTest, WithContext) {
        const auto error = Error::not_found("item missing");
        const auto with_ctx = error.with_context("corpus=kernel");

        EXPECT_EQ(with_ctx.context().value(), "corpus=kernel");

        const auto more_ctx = with_ctx.with_context("file=main.c");
        EXPECT_EQ(more_ctx.context().value(), "corpus=kernel; file=main.c");
    }

    TEST(ErrorTest, ToString) {
        const auto error = Error::cancelled("stop");
        EXPECT_EQ(error.to_string(), "[Cancelled] stop");

        const auto with_ctx = Error::io_error("open failed", "/tmp/file.rs");
        EXPECT_EQ(with_ctx.to_string(), "[IoError] open failed (context: /tmp/file.rs)");
    }

    TEST(ErrorTest, StreamOutput) {
        const auto error = Error::not_found("missing", "key");
        std::ostringstream oss;
        oss << error;
        EXPECT_EQ(oss.str(), "[NotFound] missing (context: key)");
    }

    TEST(ErrorTest, ErrorCodeKeysAreSnakeCase) {
        EXPECT_STREQ(error_code_to_key(ErrorCode::InvalidArgument), "invalid_argument");
        EXPECT_STREQ(error_code_to_key(ErrorCode::NotFound), "not_found");
        EXPECT_STREQ(error_code_to_key(ErrorCode::ParseError), "parse_error");
        EXPECT_STREQ(error_code_to_key(ErrorCode::IoError), "io_error");
        EXPECT_STREQ(error_code_to_key(ErrorCode::ConfigError), "config_error");
        EXPECT_STREQ(error_code_to_key(ErrorCode::DuplicateSymbol), "duplicate_symbol");
        EXPECT_STREQ(error_code_to_key(ErrorCode::CacheCorrupted), "cache_corrupted");
        EXPECT_STREQ(error_code_to_key(ErrorCode::Cancelled), "cancelled");
        EXPECT_STREQ(error_code_to_key(ErrorCode::InternalError), "internal_error");
    }

    TEST(ErrorTest, ErrorCodeStreamOutput) {
        std::ostringstream oss;
        oss << ErrorCode::DuplicateSymbol;
        EXPECT_EQ(oss.str(), "DuplicateSymbol");
    }

    TEST(ErrorTest, Equality) {
        const auto e1 = Error::not_found("missing", "key");
        const auto e2 = Error::not_found("missing", "key");
        const auto e3 = Error::not_found("missing", "other");
        const auto e4 = Error::io_error("missing", "key");

        EXPECT_EQ(e1, e2);
        EXPECT_NE(e1, e3);
        EXPECT_NE(e1, e4);
    }

}  // namespace cie
