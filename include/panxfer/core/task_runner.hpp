#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

namespace panxfer::core {

/**
 * @brief Fixed-size worker pool running one task per submitted call
 *
 * THREAD SAFETY:
 * - submit() may be called from any thread, including from a task
 * - Destruction waits for queued tasks to finish
 */
class TaskRunner {
public:
    explicit TaskRunner(std::size_t threads) : pool_(threads == 0 ? 1 : threads) {}

    ~TaskRunner() {
        pool_.join();
    }

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

    template<typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        // packaged_task is move-only; asio handlers get copied in some paths
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto future = task->get_future();
        boost::asio::post(pool_, [task]() { (*task)(); });
        return future;
    }

private:
    boost::asio::thread_pool pool_;
};

} // namespace panxfer::core
