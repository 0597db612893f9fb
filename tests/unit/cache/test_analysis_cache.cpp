//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/cache/analysis_cache.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

namespace cie::cache
{
    namespace {
        ArtifactsPtr make_artifacts(const std::string& path, const std::string& hash) {
            auto artifacts = std::make_shared<FileArtifacts>();
            artifacts->file_path = path;
            artifacts->content_hash = hash;
            artifacts->analysis.file_path = path;
            return artifacts;
        }
    }

    class AnalysisCacheTest : public ::testing::Test {
    protected:
        AnalysisCache cache_;
    };

    TEST_F(AnalysisCacheTest, MissingEntryIsNull) {
        const auto result = cache_.lookup("missing.c");
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value(), nullptr);
        EXPECT_EQ(cache_.get_stats().misses, 1u);
    }

    TEST_F(AnalysisCacheTest, StoreAndLookup) {
        const auto artifacts = make_artifacts("a.c", "abc");
        cache_.store(artifacts);

        const auto result = cache_.lookup("a.c");
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value(), artifacts);

        const auto stats = cache_.get_stats();
        EXPECT_EQ(stats.total_entries, 1u);
        EXPECT_EQ(stats.hits, 1u);
    }

    TEST_F(AnalysisCacheTest, LookupByHashRejectsStaleContent) {
        cache_.store(make_artifacts("a.c", "old"));

        const auto fresh = cache_.lookup("a.c", "old");
        ASSERT_TRUE(fresh.is_ok());
        EXPECT_NE(fresh.value(), nullptr);

        const auto stale = cache_.lookup("a.c", "new");
        ASSERT_TRUE(stale.is_ok());
        EXPECT_EQ(stale.value(), nullptr);
    }

    TEST_F(AnalysisCacheTest, StoreReplacesPreviousVersion) {
        const auto first = make_artifacts("a.c", "v1");
        cache_.store(first);
        cache_.store(make_artifacts("a.c", "v2"));

        const auto result = cache_.lookup("a.c");
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value()->content_hash, "v2");
        EXPECT_EQ(first->content_hash, "v1");
        EXPECT_EQ(cache_.get_stats().total_entries, 1u);
    }

    TEST_F(AnalysisCacheTest, MismatchedKeyIsCorrupted) {
        cache_.store("a.c", "expected", make_artifacts("a.c", "different"));

        const auto result = cache_.lookup("a.c");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::CacheCorrupted);
        EXPECT_EQ(result.error().context().value_or(""), "a.c");
    }

    TEST_F(AnalysisCacheTest, ArtifactsFiledUnderWrongPathAreCorrupted) {
        cache_.store("a.c", "h", make_artifacts("b.c", "h"));

        const auto result = cache_.lookup("a.c");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::CacheCorrupted);
    }

    TEST_F(AnalysisCacheTest, CorruptedEntryRecoversAfterErase) {
        cache_.store("a.c", "expected", make_artifacts("a.c", "different"));
        ASSERT_TRUE(cache_.lookup("a.c").is_err());

        EXPECT_TRUE(cache_.erase("a.c"));
        EXPECT_FALSE(cache_.erase("a.c"));

        cache_.store(make_artifacts("a.c", "expected"));
        const auto result = cache_.lookup("a.c");
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value()->content_hash, "expected");
    }

    TEST_F(AnalysisCacheTest, StoreNullIsIgnored) {
        cache_.store(ArtifactsPtr{});
        EXPECT_EQ(cache_.get_stats().total_entries, 0u);
    }

    TEST_F(AnalysisCacheTest, ClearDropsEverything) {
        cache_.store(make_artifacts("a.c", "1"));
        cache_.store(make_artifacts("b.c", "2"));
        cache_.clear();

        EXPECT_EQ(cache_.get_stats().total_entries, 0u);
        EXPECT_EQ(cache_.lookup("a.c").value(), nullptr);
    }

    TEST_F(AnalysisCacheTest, ConcurrentWritersOnDifferentFiles) {
        constexpr int kThreads = 8;
        constexpr int kRounds = 200;

        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([this, t] {
                const std::string path = "file" + std::to_string(t) + ".c";
                for (int r = 0; r < kRounds; ++r) {
                    cache_.store(make_artifacts(path, std::to_string(r)));
                    const auto result = cache_.lookup(path);
                    ASSERT_TRUE(result.is_ok());
                    ASSERT_NE(result.value(), nullptr);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        EXPECT_EQ(cache_.get_stats().total_entries, static_cast<std::size_t>(kThreads));
        for (int t = 0; t < kThreads; ++t) {
            const auto result = cache_.lookup("file" + std::to_string(t) + ".c");
            ASSERT_TRUE(result.is_ok());
            EXPECT_EQ(result.value()->content_hash, std::to_string(kRounds - 1));
        }
    }

}  // namespace cie::cache
