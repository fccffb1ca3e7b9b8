#include "sshm/ProgressChannel.hpp"

namespace sshm {

ProgressChannel::ProgressChannel(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool ProgressChannel::offer(const TransferProgress &update) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (closed_ || queue_.size() >= capacity_) {
            ++dropped_;
            return false;
        }
        queue_.push_back(update);
    }
    cv_.notify_one();
    return true;
}

void ProgressChannel::publishFinal(const TransferProgress &update) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        // Finals of earlier files stay queued, past capacity if needed.
        if (queue_.size() >= capacity_ && !queue_.back().done) {
            queue_.back() = update;
            ++dropped_;
        } else {
            queue_.push_back(update);
        }
    }
    cv_.notify_one();
}

bool ProgressChannel::receive(TransferProgress &out,
                              std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex_);
    if (!cv_.wait_for(lk, timeout,
                      [this] { return !queue_.empty() || closed_; }))
        return false;
    if (queue_.empty())
        return false;
    out = queue_.front();
    queue_.pop_front();
    return true;
}

bool ProgressChannel::tryReceive(TransferProgress &out) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (queue_.empty())
        return false;
    out = queue_.front();
    queue_.pop_front();
    return true;
}

void ProgressChannel::close() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressChannel::isClosed() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return closed_;
}

std::size_t ProgressChannel::dropped() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return dropped_;
}

} // namespace sshm
