#include "ThreadPool.h"
#include "Logger.h"

#include <stdexcept>

namespace CubeLink {

    ThreadPool::ThreadPool(std::size_t threadCount) {
        if (threadCount == 0) {
            auto hw = std::thread::hardware_concurrency();
            threadCount = hw == 0 ? 1 : hw;
        }
        threadCount_ = threadCount;

        workers_.reserve(threadCount);
        for (std::size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back(&ThreadPool::workerLoop, this);
        }
    }

    ThreadPool::~ThreadPool() {
        shutdown();
    }

    bool ThreadPool::submit(const std::string& key, TaskBody body) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ || unfinished_.count(key) > 0) {
                return false;
            }
            auto token = std::make_shared<std::atomic<bool>>(false);
            unfinished_[key] = token;
            queue_.push(Job{key, token, std::move(body)});
        }
        workAvailable_.notify_one();
        return true;
    }

    bool ThreadPool::cancel(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = unfinished_.find(key);
        if (it == unfinished_.end()) {
            return false;
        }
        it->second->store(true);
        return true;
    }

    bool ThreadPool::wait(const std::string& key, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return taskFinished_.wait_for(lock, timeout, [this, &key]() {
            return unfinished_.count(key) == 0;
        });
    }

    std::size_t ThreadPool::active() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return unfinished_.size();
    }

    void ThreadPool::shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return;
            }
            stopping_ = true;
            for (auto& [key, token] : unfinished_) {
                token->store(true);
            }
        }

        workAvailable_.notify_all();

        for (auto& t : workers_) {
            if (t.joinable()) {
                t.join();
            }
        }

        workers_.clear();
    }

    void ThreadPool::workerLoop() {
        for (;;) {
            Job job;

            {
                std::unique_lock<std::mutex> lock(mutex_);
                workAvailable_.wait(lock, [this]() {
                    return stopping_ || !queue_.empty();
                });

                if (stopping_ && queue_.empty()) {
                    return;
                }

                job = std::move(queue_.front());
                queue_.pop();
            }

            try {
                job.body(job.token);
            } catch (const std::exception& e) {
                Logger::instance().error("Task " + job.key + " threw: " + e.what(), "ThreadPool");
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                unfinished_.erase(job.key);
            }
            taskFinished_.notify_all();
        }
    }

} // namespace CubeLink
