#ifndef SCRIPTOR_THREAD_POOL_H
#define SCRIPTOR_THREAD_POOL_H

#include <scriptor/exceptions.h>
#include <thread>              // std::thread
#include <queue>               // std::queue
#include <mutex>               // std::mutex
#include <condition_variable>  // std::condition_variable
#include <vector>              // std::vector
#include <functional>          // std::function
#include <future>              // std::packaged_task, std::future
#include <memory>              // std::shared_ptr
#include <type_traits>         // std::invoke_result_t
#include <utility>             // std::move

namespace scriptor {

/**
 * @brief Fixed set of worker threads over a bounded FIFO of tasks.
 *
 * Destruction (or stop()) lets the workers finish what is already queued.
 */
class ThreadPool {
private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::mutex queue_mutex;
    std::condition_variable cv;
    bool stop_;
    size_t max_queue_size_;

public:
    explicit ThreadPool(const size_t num_threads, size_t max_queue_size = 1024)
        : stop_(false),
          max_queue_size_(max_queue_size ? max_queue_size : 1024) {

        const size_t count = num_threads ? num_threads : 1;
        for (size_t i = 0; i < count; i++) {
            workers.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock lock(queue_mutex);
                        cv.wait(lock, [this] {
                            return !tasks.empty() || stop_;
                        });

                        if (stop_ && tasks.empty()) {
                            return;
                        }

                        task = std::move(tasks.front());
                        tasks.pop();
                    }
                    task();
                }
            });
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Non-blocking enqueue - returns false if queue is full or stopped
    bool try_enqueue(std::function<void()> task) {
        std::unique_lock lock(queue_mutex);

        if (stop_ || tasks.size() >= max_queue_size_) {
            return false;
        }

        tasks.push(std::move(task));
        cv.notify_one();
        return true;
    }

    /**
     * @brief Queues `fn` and returns a future for its result.
     * Exceptions thrown by `fn` surface from future::get().
     * @throws QueueFullError if the queue is full or the pool is stopping.
     */
    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto future = task->get_future();

        if (!try_enqueue([task] { (*task)(); })) {
            throw QueueFullError();
        }
        return future;
    }

    size_t size() const { return workers.size(); }

    size_t pending() {
        std::unique_lock lock(queue_mutex);
        return tasks.size();
    }

    void stop() {
        {
            std::unique_lock lock(queue_mutex);
            stop_ = true;
            cv.notify_all();
        }
        for (std::thread& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ~ThreadPool() {
        stop();
    }
};

} // namespace scriptor

#endif // SCRIPTOR_THREAD_POOL_H
