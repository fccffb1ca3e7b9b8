#pragma once
#include "TerminalDevice.hpp"
#include <termios.h>

namespace sshm {

// stdin/stdout/stderr of the process. SIGINT, SIGTERM and SIGWINCH are
// routed through a self-pipe while an instance exists; only one instance
// may be alive at a time.
class PosixTerminalDevice : public TerminalDevice {
public:
    PosixTerminalDevice();
    ~PosixTerminalDevice() override;

    PosixTerminalDevice(const PosixTerminalDevice &) = delete;
    PosixTerminalDevice &operator=(const PosixTerminalDevice &) = delete;

    // Installs the signal handlers. Must succeed before waitEvent() reports
    // anything.
    bool init(Error &err);

    bool isTerminal() const override;
    bool size(TerminalSize &out) const override;
    bool enterRaw(Error &err) override;
    bool restore(Error &err) override;
    long readInput(char *buf, std::size_t len, int timeoutMs,
                   Error &err) override;
    bool writeOutput(const char *buf, std::size_t len, Error &err) override;
    bool writeError(const char *buf, std::size_t len, Error &err) override;
    TerminalEvent waitEvent(int timeoutMs) override;

private:
    bool writeAll(int fd, const char *buf, std::size_t len, Error &err);
    void uninstall();

    bool installed_ = false;
    bool saved_ = false;
    struct termios saved_mode_{};
};

} // namespace sshm
