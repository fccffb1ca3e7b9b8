// Bridges the local terminal and one remote interactive shell.
#pragma once
#include "Session.hpp"
#include "TerminalDevice.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace sshm {

class TerminalController {
public:
    TerminalController(Session &session, TerminalDevice &device);
    ~TerminalController();

    TerminalController(const TerminalController &) = delete;
    TerminalController &operator=(const TerminalController &) = delete;

    // Opens the shell channel and requests the remote pseudo-terminal. Must
    // precede startShell().
    bool configureTerminal(const std::string &termType, Error &err);

    // Blocks until the remote shell ends, the session is disconnected or a
    // termination signal arrives. The local terminal mode is restored
    // before returning. Benign shell endings are not errors.
    bool startShell(ShellExit &exit, Error &err);

    void setResizePollInterval(std::chrono::milliseconds interval) {
        pollInterval_ = interval;
    }
    void setResizeDebounce(std::chrono::milliseconds window) {
        debounce_ = window;
    }

private:
    TerminalSize currentSize() const;
    void inputLoop();
    void monitorLoop();
    void releaseChannel(Error &err);
    void recordBackgroundError(const Error &e);

    Session &session_;
    TerminalDevice &device_;
    std::shared_ptr<ShellChannel> channel_;
    std::string termType_;

    std::chrono::milliseconds pollInterval_{100};
    std::chrono::milliseconds debounce_{50};

    std::atomic<bool> stop_{false};
    std::atomic<bool> interrupted_{false};

    // First failure seen by the input or resize task.
    std::mutex backgroundMutex_;
    Error backgroundErr_;
};

} // namespace sshm
