#include "sms/formatting.hpp"

namespace tether::sms {

QString format_relative_time(Timestamp then, Timestamp now) {
    const int64_t seconds = now.millis() / 1000 - then.millis() / 1000;

    if (seconds < 60) {
        return QStringLiteral("Just now");
    }
    if (seconds < 3600) {
        return QStringLiteral("%1 min ago").arg(seconds / 60);
    }
    if (seconds < 86400) {
        return QStringLiteral("%1 hours ago").arg(seconds / 3600);
    }
    if (seconds < 604800) {
        return QStringLiteral("%1 days ago").arg(seconds / 86400);
    }
    return QStringLiteral("More than a week ago");
}

QString truncate_message(const QString& text, qsizetype max_len) {
    if (max_len < 0 || text.size() <= max_len) {
        return text;
    }
    return text.left(max_len) + QStringLiteral("...");
}

} // namespace tether::sms
