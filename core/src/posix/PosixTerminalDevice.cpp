// POSIX terminal: termios raw mode, TIOCGWINSZ, and signals delivered
// through a non-blocking self-pipe.
#include "sshm/PosixTerminalDevice.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace sshm {

namespace {

int g_pipe[2] = {-1, -1};
std::atomic<bool> g_active{false};

struct sigaction g_oldInt;
struct sigaction g_oldTerm;
struct sigaction g_oldWinch;

void onSignal(int sig) {
    const int saved = errno;
    const char c = sig == SIGWINCH ? 'r' : 'i';
    if (g_pipe[1] != -1) {
        // Full pipe: an event of this kind is already pending.
        ssize_t n = ::write(g_pipe[1], &c, 1);
        (void)n;
    }
    errno = saved;
}

bool setNonBlocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    return flags != -1 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

Error sysError(const char *what) {
    return Error::make(ErrorKind::Connection,
                       std::string(what) + ": " + std::strerror(errno));
}

} // namespace

PosixTerminalDevice::PosixTerminalDevice() = default;

PosixTerminalDevice::~PosixTerminalDevice() {
    Error ignored;
    restore(ignored);
    uninstall();
}

bool PosixTerminalDevice::init(Error &err) {
    if (installed_)
        return true;
    bool expected = false;
    if (!g_active.compare_exchange_strong(expected, true)) {
        err = Error::make(ErrorKind::InvalidArgument,
                          "another terminal device is active");
        return false;
    }
    if (::pipe(g_pipe) != 0) {
        err = sysError("pipe");
        g_active = false;
        return false;
    }
    if (!setNonBlocking(g_pipe[0]) || !setNonBlocking(g_pipe[1])) {
        err = sysError("fcntl");
        ::close(g_pipe[0]);
        ::close(g_pipe[1]);
        g_pipe[0] = g_pipe[1] = -1;
        g_active = false;
        return false;
    }

    struct sigaction sa{};
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, &g_oldInt) != 0 ||
        ::sigaction(SIGTERM, &sa, &g_oldTerm) != 0 ||
        ::sigaction(SIGWINCH, &sa, &g_oldWinch) != 0) {
        err = sysError("sigaction");
        installed_ = true;
        uninstall();
        return false;
    }
    installed_ = true;
    return true;
}

void PosixTerminalDevice::uninstall() {
    if (!installed_)
        return;
    ::sigaction(SIGINT, &g_oldInt, nullptr);
    ::sigaction(SIGTERM, &g_oldTerm, nullptr);
    ::sigaction(SIGWINCH, &g_oldWinch, nullptr);
    const int r = g_pipe[0];
    const int w = g_pipe[1];
    g_pipe[0] = g_pipe[1] = -1;
    ::close(r);
    ::close(w);
    installed_ = false;
    g_active = false;
}

bool PosixTerminalDevice::isTerminal() const {
    return ::isatty(STDIN_FILENO) == 1;
}

bool PosixTerminalDevice::size(TerminalSize &out) const {
    struct winsize ws{};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) != 0 &&
        ::ioctl(STDIN_FILENO, TIOCGWINSZ, &ws) != 0)
        return false;
    if (ws.ws_col == 0 || ws.ws_row == 0)
        return false;
    out.cols = ws.ws_col;
    out.rows = ws.ws_row;
    return true;
}

bool PosixTerminalDevice::enterRaw(Error &err) {
    struct termios mode{};
    if (::tcgetattr(STDIN_FILENO, &mode) != 0) {
        err = sysError("tcgetattr");
        return false;
    }
    saved_mode_ = mode;
    saved_ = true;
    ::cfmakeraw(&mode);
    if (::tcsetattr(STDIN_FILENO, TCSANOW, &mode) != 0) {
        err = sysError("tcsetattr");
        saved_ = false;
        return false;
    }
    return true;
}

bool PosixTerminalDevice::restore(Error &err) {
    if (!saved_)
        return true;
    saved_ = false;
    if (::tcsetattr(STDIN_FILENO, TCSANOW, &saved_mode_) != 0) {
        err = sysError("tcsetattr");
        return false;
    }
    return true;
}

long PosixTerminalDevice::readInput(char *buf, std::size_t len, int timeoutMs,
                                    Error &err) {
    struct pollfd pfd{};
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, timeoutMs);
    if (ready == 0 || (ready < 0 && errno == EINTR))
        return 0;
    if (ready < 0) {
        err = sysError("poll");
        return -1;
    }
    const ssize_t n = ::read(STDIN_FILENO, buf, len);
    if (n > 0)
        return (long)n;
    if (n == 0)
        return -1;
    if (errno == EINTR || errno == EAGAIN)
        return 0;
    err = sysError("read");
    return -1;
}

bool PosixTerminalDevice::writeAll(int fd, const char *buf, std::size_t len,
                                   Error &err) {
    std::size_t done = 0;
    while (done < len) {
        const ssize_t n = ::write(fd, buf + done, len - done);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            err = sysError("write");
            return false;
        }
        done += (std::size_t)n;
    }
    return true;
}

bool PosixTerminalDevice::writeOutput(const char *buf, std::size_t len,
                                      Error &err) {
    return writeAll(STDOUT_FILENO, buf, len, err);
}

bool PosixTerminalDevice::writeError(const char *buf, std::size_t len,
                                     Error &err) {
    return writeAll(STDERR_FILENO, buf, len, err);
}

TerminalEvent PosixTerminalDevice::waitEvent(int timeoutMs) {
    if (!installed_) {
        ::poll(nullptr, 0, timeoutMs);
        return TerminalEvent::None;
    }
    struct pollfd pfd{};
    pfd.fd = g_pipe[0];
    pfd.events = POLLIN;
    if (::poll(&pfd, 1, timeoutMs) <= 0)
        return TerminalEvent::None;

    // Drain; an interrupt outranks any resize queued with it.
    TerminalEvent ev = TerminalEvent::None;
    char c = 0;
    while (::read(g_pipe[0], &c, 1) == 1) {
        if (c == 'i')
            ev = TerminalEvent::Interrupt;
        else if (ev == TerminalEvent::None)
            ev = TerminalEvent::Resize;
    }
    return ev;
}

} // namespace sshm
