#include "ProgressPrinter.hpp"
#include "Logging.hpp"

#include <QLocale>

#include <chrono>
#include <cstdio>

namespace sshm {

ProgressPrinter::ProgressPrinter(ProgressChannel &channel, Writer writer)
    : channel_(channel), writer_(std::move(writer)) {
    if (!writer_) {
        writer_ = [](const QString &line) {
            std::fputs(line.toLocal8Bit().constData(), stderr);
            std::fflush(stderr);
        };
    }
}

ProgressPrinter::~ProgressPrinter() { stop(); }

void ProgressPrinter::start() {
    if (thread_.joinable())
        return;
    thread_ = std::thread([this] { run(); });
}

void ProgressPrinter::stop() {
    channel_.close();
    if (thread_.joinable())
        thread_.join();
    if (channel_.dropped() > 0)
        qCDebug(sshmTransfer) << "progress updates dropped:"
                              << (qulonglong)channel_.dropped();
}

QString ProgressPrinter::formatLine(const TransferProgress &p) {
    const QLocale locale = QLocale::c();
    QString line = QStringLiteral("\r%1  %2")
                       .arg(QString::fromStdString(p.file_name),
                            locale.formattedDataSize((qint64)p.transferred_bytes));
    if (p.total_bytes > 0) {
        const int percent =
            (int)((p.transferred_bytes * 100) / p.total_bytes);
        line += QStringLiteral(" / %1  %2%")
                    .arg(locale.formattedDataSize((qint64)p.total_bytes))
                    .arg(percent);
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - p.start_time);
    if (p.start_time != std::chrono::system_clock::time_point{} &&
        elapsed.count() > 0) {
        const qint64 rate =
            (qint64)(p.transferred_bytes * 1000 / (std::uint64_t)elapsed.count());
        line += QStringLiteral("  %1/s").arg(locale.formattedDataSize(rate));
    }
    if (p.done)
        line += QLatin1Char('\n');
    return line;
}

void ProgressPrinter::run() {
    TransferProgress p;
    for (;;) {
        if (channel_.receive(p, std::chrono::milliseconds(200))) {
            writer_(formatLine(p));
            ++rendered_;
            continue;
        }
        if (!channel_.isClosed())
            continue;
        while (channel_.tryReceive(p)) {
            writer_(formatLine(p));
            ++rendered_;
        }
        return;
    }
}

} // namespace sshm
