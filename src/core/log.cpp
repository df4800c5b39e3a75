#include "core/log.hpp"

// Debug output is off by default; --debug-relay flips the relay categories on.
Q_LOGGING_CATEGORY(tetherRelayLog, "tether.relay", QtInfoMsg)
Q_LOGGING_CATEGORY(tetherSmsLog, "tether.sms", QtInfoMsg)
Q_LOGGING_CATEGORY(tetherCommandsLog, "tether.commands", QtInfoMsg)
Q_LOGGING_CATEGORY(tetherLinkLog, "tether.link", QtInfoMsg)
Q_LOGGING_CATEGORY(tetherAppLog, "tether.app", QtInfoMsg)
