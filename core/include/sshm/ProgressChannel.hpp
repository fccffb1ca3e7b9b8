// Bounded, non-blocking progress sink between a transfer and its observer.
#pragma once
#include "SshTypes.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace sshm {

class ProgressChannel {
public:
    explicit ProgressChannel(std::size_t capacity = 64);

    // Never blocks. Returns false (and counts a drop) when the queue is full
    // or closed.
    bool offer(const TransferProgress &update);

    // Never blocks and is never dropped: when the queue is full the newest
    // queued update is replaced unless it is itself a final one, in which
    // case the queue grows past capacity.
    void publishFinal(const TransferProgress &update);

    // Waits up to timeout. Returns false on timeout, or once the channel is
    // closed and drained.
    bool receive(TransferProgress &out, std::chrono::milliseconds timeout);
    bool tryReceive(TransferProgress &out);

    // Wakes receivers; queued updates can still be drained.
    void close();
    bool isClosed() const;

    std::size_t dropped() const;
    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TransferProgress> queue_;
    std::size_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace sshm
