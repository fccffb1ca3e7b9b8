// Local terminal capability: size, raw mode, restore, I/O and events.
// The controller above it is platform independent.
#pragma once
#include "SshTypes.hpp"
#include <cstddef>

namespace sshm {

enum class TerminalEvent { None, Resize, Interrupt };

class TerminalDevice {
public:
    virtual ~TerminalDevice() = default;

    // False when standard input is not an interactive terminal.
    virtual bool isTerminal() const = 0;
    // Returns false when the size cannot be determined.
    virtual bool size(TerminalSize &out) const = 0;

    virtual bool enterRaw(Error &err) = 0;
    // Puts back the mode captured by enterRaw().
    virtual bool restore(Error &err) = 0;

    // > 0: bytes read, 0: nothing within timeoutMs, < 0: input closed or
    // failed (err filled on failure).
    virtual long readInput(char *buf, std::size_t len, int timeoutMs,
                           Error &err) = 0;
    virtual bool writeOutput(const char *buf, std::size_t len, Error &err) = 0;
    virtual bool writeError(const char *buf, std::size_t len, Error &err) = 0;

    // Waits up to timeoutMs for a resize or termination signal.
    virtual TerminalEvent waitEvent(int timeoutMs) = 0;
};

// Raw mode for one scope. The saved mode is restored exactly once: by
// release() or, failing that, by the destructor.
class RawModeGuard {
public:
    explicit RawModeGuard(TerminalDevice &device);
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard &) = delete;
    RawModeGuard &operator=(const RawModeGuard &) = delete;

    bool enter(Error &err);
    bool active() const { return active_; }
    bool release(Error &err);

private:
    TerminalDevice &device_;
    bool active_ = false;
};

} // namespace sshm
