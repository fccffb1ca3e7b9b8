// Forwarding task: drains a ProgressChannel on its own thread and renders
// one status line per update.
#pragma once
#include "sshm/ProgressChannel.hpp"
#include <QString>
#include <atomic>
#include <functional>
#include <thread>

namespace sshm {

class ProgressPrinter {
public:
    using Writer = std::function<void(const QString &line)>;

    // The default writer redraws a single line on stderr.
    explicit ProgressPrinter(ProgressChannel &channel, Writer writer = {});
    ~ProgressPrinter();

    ProgressPrinter(const ProgressPrinter &) = delete;
    ProgressPrinter &operator=(const ProgressPrinter &) = delete;

    void start();
    // Closes the channel, renders what is still queued and joins.
    void stop();

    int rendered() const { return rendered_; }

    static QString formatLine(const TransferProgress &p);

private:
    void run();

    ProgressChannel &channel_;
    Writer writer_;
    std::thread thread_;
    std::atomic<int> rendered_{0};
};

} // namespace sshm
