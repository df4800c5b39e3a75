#pragma once

#include "core/types.hpp"
#include <QString>

namespace tether::sms {

/**
 * Relative age for the conversation list: "Just now", "5 min ago",
 * "3 hours ago", "2 days ago", "More than a week ago".
 */
[[nodiscard]] QString format_relative_time(Timestamp then, Timestamp now);

/**
 * Cut `text` to at most `max_len` characters, appending "..." when cut.
 */
[[nodiscard]] QString truncate_message(const QString& text, qsizetype max_len);

} // namespace tether::sms
