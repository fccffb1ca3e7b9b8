#include "sshm/TerminalController.hpp"

#include <algorithm>
#include <thread>
#include <vector>

namespace sshm {

using Clock = std::chrono::steady_clock;

TerminalController::TerminalController(Session &session,
                                       TerminalDevice &device)
    : session_(session), device_(device) {}

TerminalController::~TerminalController() {
    Error ignored;
    releaseChannel(ignored);
}

TerminalSize TerminalController::currentSize() const {
    TerminalSize size;
    if (!device_.isTerminal() || !device_.size(size))
        return TerminalSize{};
    return size;
}

void TerminalController::releaseChannel(Error &err) {
    if (!channel_)
        return;
    std::shared_ptr<ShellChannel> ch = std::move(channel_);
    channel_.reset();
    session_.releaseShellChannel(ch);
    ch->close(err);
}

void TerminalController::recordBackgroundError(const Error &e) {
    std::lock_guard<std::mutex> lk(backgroundMutex_);
    if (backgroundErr_.ok())
        backgroundErr_ = e;
}

bool TerminalController::configureTerminal(const std::string &termType,
                                           Error &err) {
    err.clear();
    if (channel_) {
        err = Error::make(ErrorKind::InvalidArgument,
                          "terminal already configured");
        return false;
    }
    if (!session_.isConnected()) {
        err = Error::make(ErrorKind::NotConnected, "not connected");
        return false;
    }
    std::shared_ptr<ShellChannel> ch = session_.openShellChannel(err);
    if (!ch)
        return false;
    channel_ = ch;

    termType_ = termType.empty() ? std::string("xterm-256color") : termType;
    const TerminalSize size = currentSize();
    if (!channel_->requestPty(termType_, TerminalModes::defaults(), size,
                              err)) {
        Error closeErr;
        releaseChannel(closeErr);
        return false;
    }
    session_.setTerminalSize(size);
    return true;
}

void TerminalController::inputLoop() {
    std::vector<char> buf(4096);
    while (!stop_) {
        Error e;
        const long n = device_.readInput(buf.data(), buf.size(),
                                         (int)pollInterval_.count(), e);
        if (n == 0)
            continue;
        if (n < 0) {
            if (!e.ok()) {
                recordBackgroundError(e);
                return;
            }
            // Local end of input: let the remote shell see it too.
            Error eofErr;
            if (!stop_ && !channel_->sendEof(eofErr))
                recordBackgroundError(eofErr);
            return;
        }
        if (!channel_->write(buf.data(), (std::size_t)n, e)) {
            if (!stop_)
                recordBackgroundError(e);
            return;
        }
    }
}

void TerminalController::monitorLoop() {
    TerminalSize sent = session_.terminalSize();
    TerminalSize pendingSize = sent;
    bool pending = false;
    Clock::time_point lastChange = Clock::now();

    while (!stop_) {
        int waitMs = (int)pollInterval_.count();
        if (pending) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                debounce_ - (Clock::now() - lastChange));
            waitMs = (int)std::max<long long>(0, left.count());
        }
        const TerminalEvent ev = device_.waitEvent(waitMs);
        if (stop_)
            break;
        if (ev == TerminalEvent::Interrupt) {
            interrupted_ = true;
            Error e;
            if (!session_.disconnect(e))
                recordBackgroundError(e);
            return;
        }

        // Signals and polling both end up here; the size itself decides.
        const TerminalSize now = currentSize();
        if (now != (pending ? pendingSize : sent)) {
            pendingSize = now;
            pending = now != sent;
            lastChange = Clock::now();
        }
        if (pending && Clock::now() - lastChange >= debounce_) {
            Error e;
            if (!channel_->windowChange(pendingSize, e)) {
                if (!stop_)
                    recordBackgroundError(e);
                return;
            }
            session_.setTerminalSize(pendingSize);
            sent = pendingSize;
            pending = false;
        }
    }
}

bool TerminalController::startShell(ShellExit &exit, Error &err) {
    err.clear();
    exit = ShellExit{};
    if (!channel_) {
        err = Error::make(ErrorKind::InvalidArgument,
                          "configureTerminal must be called first");
        return false;
    }
    stop_ = false;
    interrupted_ = false;
    {
        std::lock_guard<std::mutex> lk(backgroundMutex_);
        backgroundErr_.clear();
    }

    RawModeGuard raw(device_);
    if (device_.isTerminal() && !raw.enter(err)) {
        Error closeErr;
        releaseChannel(closeErr);
        return false;
    }
    if (!channel_->startShell(err)) {
        Error restoreErr;
        raw.release(restoreErr);
        Error closeErr;
        releaseChannel(closeErr);
        return false;
    }

    std::thread input([this] { inputLoop(); });
    std::thread monitor([this] { monitorLoop(); });

    Error readErr;
    std::vector<char> buf(32768);
    for (;;) {
        bool isStderr = false;
        Error e;
        const long n = channel_->read(buf.data(), buf.size(),
                                      (int)pollInterval_.count(), isStderr, e);
        if (n > 0) {
            const bool ok = isStderr
                                ? device_.writeError(buf.data(), (std::size_t)n, e)
                                : device_.writeOutput(buf.data(), (std::size_t)n, e);
            if (!ok) {
                readErr = e;
                break;
            }
            continue;
        }
        if (n == 0) {
            if (interrupted_)
                break;
            continue;
        }
        if (!e.ok())
            readErr = e;
        break;
    }

    stop_ = true;
    input.join();
    monitor.join();

    exit = channel_->exitInfo();
    exit.interrupted = interrupted_;

    Error restoreErr;
    const bool restored = raw.release(restoreErr);
    Error closeErr;
    releaseChannel(closeErr);

    Error background;
    {
        std::lock_guard<std::mutex> lk(backgroundMutex_);
        background = backgroundErr_;
    }

    if (interrupted_) {
        // A signal-driven close is an orderly end of the shell.
        exit.benign = true;
        err = background;
        return background.ok();
    }
    if (!readErr.ok() && session_.isConnected()) {
        err = readErr;
        return false;
    }
    if (!session_.isConnected()) {
        // The session went away underneath the shell (keepalive failure or
        // a disconnect from another thread).
        const Error last = session_.lastError();
        if (!last.ok()) {
            err = last;
            return false;
        }
        exit.benign = true;
        return true;
    }
    if (!exit.benign) {
        err = Error::make(ErrorKind::Connection,
                          "remote shell terminated by signal " +
                              exit.exit_signal);
        return false;
    }
    if (!background.ok()) {
        err = background;
        return false;
    }
    if (!restored) {
        err = restoreErr;
        return false;
    }
    if (!closeErr.ok()) {
        err = Error::make(ErrorKind::ResourceRelease,
                          "close failed: " + closeErr.describe());
        return false;
    }
    return true;
}

} // namespace sshm
