//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_PARALLEL_HPP
#define CIE_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Worker pool and cancellation primitives for Stage 1 analysis.
 *
 * Stage 1 tasks are independent per file, so they are submitted to a fixed
 * pool and joined through their futures. Joining every future is the hard
 * barrier in front of linking: map() returns only after all tasks finished.
 */

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace cie::parallel {

    inline unsigned int hardware_concurrency() noexcept {
        unsigned int n = std::thread::hardware_concurrency();
        return n > 0 ? n : 1;
    }

    /**
     * Cooperative cancellation flag shared between the caller and the
     * tasks of one batch. Copies observe the same flag.
     */
    class CancellationToken {
    public:
        CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

        void cancel() noexcept {
            flag_->store(true, std::memory_order_release);
        }

        [[nodiscard]] bool is_cancelled() const noexcept {
            return flag_->load(std::memory_order_acquire);
        }

    private:
        std::shared_ptr<std::atomic<bool>> flag_;
    };

    /**
     * Fixed-size thread pool with a FIFO task queue.
     */
    class ThreadPool {
    public:
        explicit ThreadPool(unsigned int num_threads = 0)
            : stop_(false) {
            if (num_threads == 0) {
                num_threads = hardware_concurrency();
            }

            workers_.reserve(num_threads);
            for (unsigned int i = 0; i < num_threads; ++i) {
                workers_.emplace_back([this] {
                    worker_loop();
                });
            }
        }

        ~ThreadPool() {
            {
                std::unique_lock lock(queue_mutex_);
                stop_ = true;
            }
            condition_.notify_all();

            for (auto& worker : workers_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * Submits a task. Exceptions thrown by the task surface from
         * future::get() on the joining thread.
         */
        template<typename F, typename... Args>
        auto submit(F&& f, Args&&... args)
            -> std::future<std::invoke_result_t<F, Args...>> {
            using return_type = std::invoke_result_t<F, Args...>;

            auto task = std::make_shared<std::packaged_task<return_type()>>(
                std::bind(std::forward<F>(f), std::forward<Args>(args)...)
            );

            std::future<return_type> result = task->get_future();

            {
                std::unique_lock lock(queue_mutex_);
                if (stop_) {
                    throw std::runtime_error("Cannot submit to stopped thread pool");
                }
                tasks_.emplace([task]() { (*task)(); });
            }

            condition_.notify_one();
            return result;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return workers_.size();
        }

    private:
        void worker_loop() {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, [this] {
                        return stop_ || !tasks_.empty();
                    });

                    if (stop_ && tasks_.empty()) {
                        return;
                    }

                    task = std::move(tasks_.front());
                    tasks_.pop();
                }

                task();
            }
        }

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_;
        bool stop_;
    };

    /**
     * Applies f to every item on the pool and waits for all of them.
     * Results keep input order. Fallible work should turn its failure into
     * part of the result value; if f throws anyway, the first exception is
     * rethrown once every task has finished with f and the items.
     */
    template<typename T, typename F>
    auto map(const std::vector<T>& items, F&& f, ThreadPool& pool)
        -> std::vector<std::invoke_result_t<F, const T&>> {
        using ResultType = std::invoke_result_t<F, const T&>;

        std::vector<std::future<ResultType>> futures;
        futures.reserve(items.size());

        for (const auto& item : items) {
            futures.push_back(pool.submit([&f, &item]() {
                return f(item);
            }));
        }

        std::vector<ResultType> results;
        results.reserve(items.size());

        std::exception_ptr failure;
        for (auto& future : futures) {
            try {
                results.push_back(future.get());
            } catch (...) {
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
        if (failure) {
            std::rethrow_exception(failure);
        }

        return results;
    }

}  // namespace cie::parallel

#endif //CIE_PARALLEL_HPP
