#pragma once

#include "core/device.hpp"
#include "core/types.hpp"
#include "sms/models.hpp"
#include <QString>
#include <vector>

namespace tether::app {

// Text output, one device per line, sorted by name then id:
//   - Pixel [paired, reachable] battery 80% (charging) signal 3/4 LTE
[[nodiscard]] QString format_device_list(std::vector<Device> devices);

// JSON output: { "devices": [ <device object>, ... ] }, same order.
[[nodiscard]] QString format_device_list_json(std::vector<Device> devices);

// Conversations in table order:
//   * Alice (+15551234567): see you soon [2 hours ago]
// A leading '*' marks unread threads.
[[nodiscard]] QString format_conversation_list(const std::vector<sms::Conversation>& conversations,
                                               Timestamp now);

} // namespace tether::app
