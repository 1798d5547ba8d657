#pragma once

#include "logger/logger.hpp"
#include <functional>
#include <future>
#include <mutex>
#include <vector>

using Task = std::function<void()>;

// Runs every submitted task on its own thread so one hung device request
// cannot hold up other toggles. Finished tasks are reaped on submit; the
// destructor waits for the rest.
class TaskRunner {
public:
    TaskRunner();
    ~TaskRunner();

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

    void submit(Task task);
    void wait_all();
    std::size_t pending();

private:
    std::vector<std::future<void>> tasks_;
    std::mutex mutex_;

    Logger logger_;

    void reap_finished();
};
