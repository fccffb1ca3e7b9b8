// Scriptable terminal for tests: settable size, queued input and events,
// captured output, and counters for raw/restore transitions.
#pragma once
#include "TerminalDevice.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>

namespace sshm {

class FakeTerminalDevice : public TerminalDevice {
public:
    explicit FakeTerminalDevice(bool interactive = true);

    // Scripting.
    void setSize(TerminalSize size);
    // Stores the new size and queues a Resize event.
    void resize(TerminalSize size);
    void pushInput(const std::string &data);
    // readInput() reports end of input once the queue is drained.
    void closeInput();
    void raise(TerminalEvent ev);
    void setRestoreFailure(bool fail);

    // Observations.
    std::string output() const;
    std::string errorOutput() const;
    int rawCount() const;
    int restoreCount() const;
    bool isRaw() const;

    bool isTerminal() const override { return interactive_; }
    bool size(TerminalSize &out) const override;
    bool enterRaw(Error &err) override;
    bool restore(Error &err) override;
    long readInput(char *buf, std::size_t len, int timeoutMs,
                   Error &err) override;
    bool writeOutput(const char *buf, std::size_t len, Error &err) override;
    bool writeError(const char *buf, std::size_t len, Error &err) override;
    TerminalEvent waitEvent(int timeoutMs) override;

private:
    const bool interactive_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    TerminalSize size_;
    std::deque<std::string> input_;
    bool inputClosed_ = false;
    std::deque<TerminalEvent> events_;
    std::string output_;
    std::string errorOutput_;
    int rawCount_ = 0;
    int restoreCount_ = 0;
    bool raw_ = false;
    bool restoreFails_ = false;
};

} // namespace sshm
