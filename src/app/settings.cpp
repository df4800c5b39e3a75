#include "app/settings.hpp"

namespace tether::app {
namespace {

constexpr const char* kSettingsBurstWindow = "relay/burst_window_ms";
constexpr const char* kSettingsBurstInterval = "relay/burst_interval_ms";
constexpr const char* kSettingsBackstopInterval = "relay/backstop_interval_ms";
constexpr const char* kSettingsPingMessage = "commands/ping_message";
constexpr const char* kSettingsRingMessage = "commands/ring_message";
constexpr const char* kSettingsFileLogging = "logging/file_enabled";

std::chrono::milliseconds read_ms(const QSettings& settings,
                                  const char* key,
                                  std::chrono::milliseconds fallback) {
    bool ok = false;
    const auto value = settings.value(QString::fromLatin1(key)).toLongLong(&ok);
    return ok ? std::chrono::milliseconds(value) : fallback;
}

QString read_text(const QSettings& settings, const char* key, const QString& fallback) {
    const auto value = settings.value(QString::fromLatin1(key), fallback).toString();
    return value.trimmed().isEmpty() ? fallback : value;
}

} // namespace

RelaySettings load_settings(const QSettings& settings) {
    const RelaySettings defaults;
    RelaySettings values;

    values.refresh.burst_window = read_ms(settings, kSettingsBurstWindow, defaults.refresh.burst_window);
    values.refresh.burst_interval = read_ms(settings, kSettingsBurstInterval, defaults.refresh.burst_interval);
    values.refresh.backstop_interval = read_ms(settings, kSettingsBackstopInterval, defaults.refresh.backstop_interval);
    values.refresh = network::sanitized(values.refresh);

    values.ping_message = read_text(settings, kSettingsPingMessage, defaults.ping_message);
    values.ring_message = read_text(settings, kSettingsRingMessage, defaults.ring_message);
    values.log_to_file = settings.value(QString::fromLatin1(kSettingsFileLogging), defaults.log_to_file).toBool();

    return values;
}

void save_settings(QSettings& settings, const RelaySettings& values) {
    settings.setValue(QString::fromLatin1(kSettingsBurstWindow),
                      static_cast<qlonglong>(values.refresh.burst_window.count()));
    settings.setValue(QString::fromLatin1(kSettingsBurstInterval),
                      static_cast<qlonglong>(values.refresh.burst_interval.count()));
    settings.setValue(QString::fromLatin1(kSettingsBackstopInterval),
                      static_cast<qlonglong>(values.refresh.backstop_interval.count()));
    settings.setValue(QString::fromLatin1(kSettingsPingMessage), values.ping_message);
    settings.setValue(QString::fromLatin1(kSettingsRingMessage), values.ring_message);
    settings.setValue(QString::fromLatin1(kSettingsFileLogging), values.log_to_file);
}

RelaySettings load_settings() {
    QSettings settings;
    return load_settings(settings);
}

void save_settings(const RelaySettings& values) {
    QSettings settings;
    save_settings(settings, values);
}

} // namespace tether::app
