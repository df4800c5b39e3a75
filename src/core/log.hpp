#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(tetherRelayLog)
Q_DECLARE_LOGGING_CATEGORY(tetherSmsLog)
Q_DECLARE_LOGGING_CATEGORY(tetherCommandsLog)
Q_DECLARE_LOGGING_CATEGORY(tetherLinkLog)
Q_DECLARE_LOGGING_CATEGORY(tetherAppLog)
