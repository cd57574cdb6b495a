// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>              // std::atomic
#include <condition_variable>  // std::condition_variable
#include <functional>          // std::bind, std::function
#include <memory>              // std::unique_ptr
#include <mutex>               // std::mutex, std::scoped_lock, std::unique_lock
#include <queue>               // std::queue
#include <utility>             // std::forward, std::move

#include <boost/thread/thread.hpp>  // boost::thread

namespace strata {

/**
 * @brief A small fixed-size pool of worker threads consuming a FIFO queue of fire-and-forget tasks.
 */
class ThreadPool {
  public:
    /**
     * @brief Construct a new thread pool.
     * @param thread_count The number of worker threads, at least one.
     * @param stack_size The stack size for each worker thread, zero meaning the OS default.
     */
    explicit ThreadPool(unsigned thread_count = 1, size_t stack_size = 0)
        : thread_count_(thread_count ? thread_count : 1),
          threads_(std::make_unique<boost::thread[]>(thread_count_)) {
        create_threads(stack_size);
    }

    // Not copyable nor movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Waits for all tasks to complete, then joins all threads. Tasks still queued in a paused pool are dropped.
     */
    ~ThreadPool() {
        wait_for_tasks();
        destroy_threads();
    }

    //! Total number of unfinished tasks: either still in the queue, or running in a thread
    size_t get_tasks_total() const { return tasks_total_; }

    unsigned get_thread_count() const { return thread_count_; }

    bool is_paused() const { return paused_; }

    //! Workers stop picking up queued tasks, running ones complete normally
    void pause() { paused_ = true; }

    void unpause() {
        {
            const std::scoped_lock tasks_lock(tasks_mutex_);
            paused_ = false;
        }
        task_available_cv_.notify_all();
    }

    /**
     * @brief Push a function with zero or more arguments, but no return value, into the task queue.
     * @param task The function to push.
     * @param args The zero or more arguments to pass to the function.
     */
    template <typename F, typename... A>
    void push_task(F&& task, A&&... args) {
        // NOLINTNEXTLINE(modernize-avoid-bind)
        std::function<void()> task_function = std::bind(std::forward<F>(task), std::forward<A>(args)...);
        {
            const std::scoped_lock tasks_lock(tasks_mutex_);
            tasks_.push(std::move(task_function));
            ++tasks_total_;
        }
        task_available_cv_.notify_one();
    }

    /**
     * @brief Wait until every task is done. If the pool is paused, only the currently running tasks are waited for.
     */
    void wait_for_tasks() {
        std::unique_lock<std::mutex> tasks_lock(tasks_mutex_);
        task_done_cv_.wait(tasks_lock, [this] { return (tasks_total_ == (paused_ ? tasks_.size() : 0)); });
    }

  private:
    void create_threads(size_t stack_size) {
        running_ = true;
        boost::thread::attributes attrs;
        if (stack_size) {
            attrs.set_stack_size(stack_size);
        }
        for (unsigned i = 0; i < thread_count_; ++i) {
            threads_[i] = boost::thread(attrs, [this] { worker(); });
        }
    }

    void destroy_threads() {
        {
            const std::scoped_lock tasks_lock(tasks_mutex_);
            running_ = false;
        }
        task_available_cv_.notify_all();
        for (unsigned i = 0; i < thread_count_; ++i) {
            threads_[i].join();
        }
    }

    void worker() {
        std::unique_lock<std::mutex> tasks_lock(tasks_mutex_);
        while (running_) {
            task_available_cv_.wait(tasks_lock, [this] { return (!tasks_.empty() && !paused_) || !running_; });
            if (!running_) break;
            std::function<void()> task = std::move(tasks_.front());
            tasks_.pop();
            tasks_lock.unlock();
            task();
            tasks_lock.lock();
            --tasks_total_;
            task_done_cv_.notify_all();
        }
    }

    //! Workers temporarily stop retrieving tasks while set
    std::atomic<bool> paused_ = false;

    //! Workers permanently stop once cleared
    std::atomic<bool> running_ = false;

    std::condition_variable task_available_cv_ = {};
    std::condition_variable task_done_cv_ = {};

    std::queue<std::function<void()>> tasks_ = {};

    //! Queued plus running tasks
    std::atomic<size_t> tasks_total_ = 0;

    mutable std::mutex tasks_mutex_ = {};

    unsigned thread_count_ = 0;

    std::unique_ptr<boost::thread[]> threads_ = nullptr;
};

}  // namespace strata
