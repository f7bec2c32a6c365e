#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace HWENC {

/**
 * @brief A fixed set of threads draining a bounded task queue; joins when the object gets destructed.
 *
 * Used for background session initialization and deferred teardown, so neither runs on the frame
 * producer's thread. submit() blocks while the queue is full.
 */
class worker_pool {
public:
    /// Possible states for a worker_pool
    enum class state {
        running,
        stopped,
    };

    explicit worker_pool(std::size_t threads = 2, std::size_t capacity = 64)
        : capacity_{capacity == 0 ? 1 : capacity} {
        const std::size_t count = threads == 0 ? 1 : threads;
        threads_.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            threads_.emplace_back(&worker_pool::thread_main, this);
        }
    }

    worker_pool(const worker_pool& other) = delete;

    worker_pool& operator=(const worker_pool& other) = delete;

    /**
     * @brief Runs what is already queued, then stops and joins every thread
     */
    ~worker_pool() {
        stop();
    }

    [[nodiscard]] state get_state() const {
        return stop_.load() ? state::stopped : state::running;
    }

    /**
     * @brief Queues @p fn and returns a future for its result (or exception).
     *
     * @throws std::logic_error if the pool has been stopped.
     */
    template<typename Fn>
    std::future<std::invoke_result_t<Fn>> submit(Fn&& fn) {
        using result_t = std::invoke_result_t<Fn>;
        auto task      = std::make_shared<std::packaged_task<result_t()>>(std::forward<Fn>(fn));
        auto future    = task->get_future();
        {
            std::unique_lock<std::mutex> lock{mutex_};
            not_full_.wait(lock, [this] {
                return stop_.load() || queue_.size() < capacity_;
            });
            if (stop_.load()) {
                throw std::logic_error{"worker_pool is stopped"};
            }
            queue_.emplace_back([task] {
                (*task)();
            });
        }
        not_empty_.notify_one();
        return future;
    }

    /**
     * @brief Blocks until the queue is empty and no task is executing.
     */
    void wait_idle() {
        std::unique_lock<std::mutex> lock{mutex_};
        idle_.wait(lock, [this] {
            return queue_.empty() && busy_ == 0;
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock{mutex_};
            if (stop_.exchange(true)) {
                return;
            }
        }
        not_empty_.notify_all();
        not_full_.notify_all();
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    [[nodiscard]] std::size_t size() const {
        return threads_.size();
    }

private:
    void thread_main() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock{mutex_};
                not_empty_.wait(lock, [this] {
                    return stop_.load() || !queue_.empty();
                });
                if (queue_.empty()) {
                    return;
                }
                task = std::move(queue_.front());
                queue_.pop_front();
                ++busy_;
            }
            not_full_.notify_one();
            // packaged_task stores exceptions in the future
            task();
            {
                std::lock_guard<std::mutex> lock{mutex_};
                --busy_;
            }
            idle_.notify_all();
        }
    }

    const std::size_t                 capacity_;
    std::atomic<bool>                 stop_{false};
    std::mutex                        mutex_;
    std::condition_variable           not_empty_;
    std::condition_variable           not_full_;
    std::condition_variable           idle_;
    std::deque<std::function<void()>> queue_;
    std::size_t                       busy_{0};
    std::vector<std::thread>          threads_;
};

} // namespace HWENC
