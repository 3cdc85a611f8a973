#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace CubeLink {

    /**
     * @brief Fixed-size worker pool running supervised transfer tasks.
     *
     * Every task is filed under a key (the transfer id) and receives a
     * cancellation token. The pool keeps the token until the task returns,
     * so a task can be cancelled while it is still queued or while it runs,
     * and waited on by key. Owned by composition; there is no global
     * instance.
     */
    class ThreadPool {
    public:
        using CancelToken = std::shared_ptr<std::atomic<bool>>;
        using TaskBody = std::function<void(const CancelToken&)>;

        explicit ThreadPool(std::size_t threadCount);
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Queue a task under a key.
         * @return false if the pool is shutting down or a task filed under
         *         the same key has not finished yet.
         */
        bool submit(const std::string& key, TaskBody body);

        /**
         * @brief Raise the token of a queued or running task.
         * @return false if no unfinished task is filed under the key.
         */
        bool cancel(const std::string& key);

        /**
         * @brief Block until the task filed under the key has returned.
         * @return false on timeout; true at once for unknown keys.
         */
        bool wait(const std::string& key, std::chrono::milliseconds timeout);

        // Tasks queued or running
        std::size_t active() const;
        std::size_t size() const { return threadCount_; }

        /**
         * @brief Raise every token, run what is queued and join all workers.
         * Queued tasks still run so each can observe its token and clean up.
         */
        void shutdown();

    private:
        struct Job {
            std::string key;
            CancelToken token;
            TaskBody body;
        };

        void workerLoop();

        std::vector<std::thread> workers_;
        std::queue<Job> queue_;
        std::unordered_map<std::string, CancelToken> unfinished_;
        mutable std::mutex mutex_;
        std::condition_variable workAvailable_;
        std::condition_variable taskFinished_;
        std::size_t threadCount_{0};
        bool stopping_{false};
    };

} // namespace CubeLink
