#include "edge_channel.hpp"

bool EdgeChannel::push(const EdgeEvent& edge) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(edge);
    }
    cv_.notify_one();
    return true;
}

bool EdgeChannel::pop(EdgeEvent& edge) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });

    if (queue_.empty()) {
        return false;
    }

    edge = queue_.front();
    queue_.pop_front();
    return true;
}

void EdgeChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EdgeChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t EdgeChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}
