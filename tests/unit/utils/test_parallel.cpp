//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/utils/parallel.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>

namespace cie::parallel
{
    TEST(ThreadPoolTest, UsesRequestedThreadCount) {
        ThreadPool pool(3);
        EXPECT_EQ(pool.size(), 3u);
    }

    TEST(ThreadPoolTest, ZeroSelectsHardwareConcurrency) {
        ThreadPool pool(0);
        EXPECT_EQ(pool.size(), hardware_concurrency());
    }

    TEST(ThreadPoolTest, SubmitReturnsFuture) {
        ThreadPool pool(2);
        auto future = pool.submit([](int a, int b) { return a + b; }, 2, 3);
        EXPECT_EQ(future.get(), 5);
    }

    TEST(ThreadPoolTest, ExceptionSurfacesFromFuture) {
        ThreadPool pool(1);
        auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
        EXPECT_THROW(future.get(), std::runtime_error);
    }

    TEST(ParallelMapTest, KeepsInputOrder) {
        ThreadPool pool(4);
        std::vector<int> items;
        for (int i = 0; i < 100; ++i) {
            items.push_back(i);
        }

        const auto results = map(items, [](const int& x) { return x * x; }, pool);

        ASSERT_EQ(results.size(), items.size());
        for (std::size_t i = 0; i < results.size(); ++i) {
            EXPECT_EQ(results[i], static_cast<int>(i * i));
        }
    }

    TEST(ParallelMapTest, WaitsForEveryTask) {
        ThreadPool pool(4);
        std::atomic<int> finished{0};
        const std::vector<std::string> files = {"a.rs", "b.rs", "c.rs", "d.rs", "e.rs"};

        (void)map(files, [&finished](const std::string& file) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            ++finished;
            return file.size();
        }, pool);

        EXPECT_EQ(finished.load(), 5);
    }

    TEST(ParallelMapTest, ThrowingTaskRethrowsAfterTheOthersFinish) {
        ThreadPool pool(2);
        std::atomic<int> finished{0};
        const std::vector<int> items = {0, 1, 2, 3, 4, 5, 6, 7};

        EXPECT_THROW((void)map(items, [&finished](const int& item) {
            if (item == 0) {
                throw std::runtime_error("bad file");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            ++finished;
            return item;
        }, pool), std::runtime_error);

        EXPECT_EQ(finished.load(), 7);
    }

    TEST(CancellationTokenTest, CopiesShareTheFlag) {
        CancellationToken token;
        const CancellationToken copy = token;

        EXPECT_FALSE(copy.is_cancelled());
        token.cancel();
        EXPECT_TRUE(copy.is_cancelled());
    }

    TEST(CancellationTokenTest, IndependentTokensDoNotInterfere) {
        CancellationToken first;
        const CancellationToken second;
        first.cancel();
        EXPECT_FALSE(second.is_cancelled());
    }

}  // namespace cie::parallel
