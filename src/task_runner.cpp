#include "task_runner.hpp"
#include <chrono>

TaskRunner::TaskRunner() : logger_("TaskRunner") {}

TaskRunner::~TaskRunner() {
    wait_all();
}

void TaskRunner::submit(Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished();

    tasks_.push_back(std::async(std::launch::async, [this, task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& e) {
            logger_.error() << "Task failed: " << e.what();
        }
    }));
}

void TaskRunner::wait_all() {
    std::vector<std::future<void>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(tasks_);
    }

    if (!tasks.empty()) {
        logger_.debug() << "Waiting for " << tasks.size() << " task(s)";
    }

    for (auto& task : tasks) {
        task.get();
    }
}

std::size_t TaskRunner::pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished();
    return tasks_.size();
}

void TaskRunner::reap_finished() {
    auto it = tasks_.begin();
    while (it != tasks_.end()) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it->get();
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}
