#include "sshm/FakeTerminalDevice.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>

namespace sshm {

FakeTerminalDevice::FakeTerminalDevice(bool interactive)
    : interactive_(interactive) {}

void FakeTerminalDevice::setSize(TerminalSize size) {
    std::lock_guard<std::mutex> lk(mutex_);
    size_ = size;
}

void FakeTerminalDevice::resize(TerminalSize size) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        size_ = size;
        events_.push_back(TerminalEvent::Resize);
    }
    cv_.notify_all();
}

void FakeTerminalDevice::pushInput(const std::string &data) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        input_.push_back(data);
    }
    cv_.notify_all();
}

void FakeTerminalDevice::closeInput() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        inputClosed_ = true;
    }
    cv_.notify_all();
}

void FakeTerminalDevice::raise(TerminalEvent ev) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        events_.push_back(ev);
    }
    cv_.notify_all();
}

void FakeTerminalDevice::setRestoreFailure(bool fail) {
    std::lock_guard<std::mutex> lk(mutex_);
    restoreFails_ = fail;
}

std::string FakeTerminalDevice::output() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return output_;
}

std::string FakeTerminalDevice::errorOutput() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return errorOutput_;
}

int FakeTerminalDevice::rawCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return rawCount_;
}

int FakeTerminalDevice::restoreCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return restoreCount_;
}

bool FakeTerminalDevice::isRaw() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return raw_;
}

bool FakeTerminalDevice::size(TerminalSize &out) const {
    std::lock_guard<std::mutex> lk(mutex_);
    out = size_;
    return true;
}

bool FakeTerminalDevice::enterRaw(Error &) {
    std::lock_guard<std::mutex> lk(mutex_);
    ++rawCount_;
    raw_ = true;
    return true;
}

bool FakeTerminalDevice::restore(Error &err) {
    std::lock_guard<std::mutex> lk(mutex_);
    ++restoreCount_;
    raw_ = false;
    if (restoreFails_) {
        err = Error::make(ErrorKind::Connection, "tcsetattr: device lost");
        return false;
    }
    return true;
}

long FakeTerminalDevice::readInput(char *buf, std::size_t len, int timeoutMs,
                                   Error &) {
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait_for(lk, std::chrono::milliseconds(timeoutMs),
                 [&] { return !input_.empty() || inputClosed_; });
    if (!input_.empty()) {
        std::string &front = input_.front();
        const std::size_t n = std::min(len, front.size());
        std::memcpy(buf, front.data(), n);
        front.erase(0, n);
        if (front.empty())
            input_.pop_front();
        return (long)n;
    }
    return inputClosed_ ? -1 : 0;
}

bool FakeTerminalDevice::writeOutput(const char *buf, std::size_t len,
                                     Error &) {
    std::lock_guard<std::mutex> lk(mutex_);
    output_.append(buf, len);
    return true;
}

bool FakeTerminalDevice::writeError(const char *buf, std::size_t len,
                                    Error &) {
    std::lock_guard<std::mutex> lk(mutex_);
    errorOutput_.append(buf, len);
    return true;
}

TerminalEvent FakeTerminalDevice::waitEvent(int timeoutMs) {
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait_for(lk, std::chrono::milliseconds(timeoutMs),
                 [&] { return !events_.empty(); });
    if (events_.empty())
        return TerminalEvent::None;
    const TerminalEvent ev = events_.front();
    events_.pop_front();
    return ev;
}

} // namespace sshm
