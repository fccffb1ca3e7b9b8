#include "sshm/TerminalDevice.hpp"

namespace sshm {

RawModeGuard::RawModeGuard(TerminalDevice &device) : device_(device) {}

RawModeGuard::~RawModeGuard() {
    // Last resort on early exits; the failure has nowhere to go.
    Error ignored;
    release(ignored);
}

bool RawModeGuard::enter(Error &err) {
    if (active_)
        return true;
    if (!device_.enterRaw(err))
        return false;
    active_ = true;
    return true;
}

bool RawModeGuard::release(Error &err) {
    if (!active_)
        return true;
    active_ = false;
    return device_.restore(err);
}

} // namespace sshm
