#pragma once

#include "network/core_link.hpp"
#include <QByteArray>
#include <QIODevice>
#include <QObject>
#include <QSocketNotifier>
#include <memory>

namespace tether::network {

/**
 * StdioCoreLink - JSON-lines connection to a Core running as the parent
 * process (or a recorded log fed in by hand).
 *
 * Inbound lines are decoded into CoreEvents and handed to on_event; a line
 * that fails to decode is logged and skipped. End of input calls on_closed
 * once. Outbound requests are written to `output` one line each.
 */
class StdioCoreLink : public QObject, public CoreEventSource, public CoreChannel {
    Q_OBJECT

public:
    /**
     * `input_fd` is watched after start(); pass -1 to drive the link with
     * feed()/finish() only. `output` is not owned and may be null, in which
     * case every send fails.
     */
    StdioCoreLink(int input_fd, QIODevice* output, QObject* parent = nullptr);
    ~StdioCoreLink() override;

    // CoreEventSource
    Result<void, Error> start() override;
    void stop() override;

    // CoreChannel
    Result<void, Error> send(const commands::Request& request) override;

    /**
     * Append raw bytes. Complete lines are decoded immediately; a trailing
     * partial line waits for more input.
     */
    void feed(const QByteArray& chunk);

    /**
     * Input ended. A buffered partial line is decoded as a final line.
     */
    void finish();

    [[nodiscard]] bool isFinished() const { return finished_; }
    [[nodiscard]] int droppedLines() const { return dropped_lines_; }

private slots:
    void onReadable();

private:
    int input_fd_;
    QIODevice* output_;
    std::unique_ptr<QSocketNotifier> notifier_;
    QByteArray buffer_;
    bool finished_ = false;
    int dropped_lines_ = 0;

    void handleLine(const QByteArray& line);
};

} // namespace tether::network
