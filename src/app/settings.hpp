#pragma once

#include "network/refresh_scheduler.hpp"
#include <QSettings>
#include <QString>

namespace tether::app {

/**
 * RelaySettings - Persisted knobs for the relay.
 *
 * Stored through QSettings under relay/, commands/ and logging/. Values
 * out of range are repaired on load, never rejected.
 */
struct RelaySettings {
    network::RefreshPolicy refresh;
    QString ping_message = QStringLiteral("Ping from Tether");
    QString ring_message = QStringLiteral("Ring ring! Find my phone");
    bool log_to_file = true;

    bool operator==(const RelaySettings&) const = default;
};

[[nodiscard]] RelaySettings load_settings(const QSettings& settings);
void save_settings(QSettings& settings, const RelaySettings& values);

// Convenience wrappers over the application's default QSettings.
[[nodiscard]] RelaySettings load_settings();
void save_settings(const RelaySettings& values);

} // namespace tether::app
