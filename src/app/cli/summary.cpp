#include "app/cli/summary.hpp"
#include "network/json_wire.hpp"
#include "sms/formatting.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>
#include <algorithm>

namespace tether::app {

namespace {

constexpr qsizetype kPreviewLength = 40;

void sort_devices(std::vector<Device>& devices) {
    std::sort(devices.begin(), devices.end(), [](const Device& a, const Device& b) {
        const int c = QString::compare(a.name, b.name, Qt::CaseInsensitive);
        if (c != 0) {
            return c < 0;
        }
        return a.id < b.id;
    });
}

[[nodiscard]] QString render_device_line(const Device& device) {
    QStringList flags;
    flags.append(QString::fromLatin1(pair_state_name(device.pair_state).data()));
    if (device.reachable) {
        flags.append(QStringLiteral("reachable"));
    }

    QString line = QStringLiteral("- ") + device.name + QStringLiteral(" [") + flags.join(QStringLiteral(", "))
        + QStringLiteral("]");

    if (device.battery_level) {
        line += QStringLiteral(" battery %1%").arg(*device.battery_level);
        if (device.charging.value_or(false)) {
            line += QStringLiteral(" (charging)");
        }
    }
    if (device.signal_strength) {
        line += QStringLiteral(" signal %1/4").arg(*device.signal_strength);
    }
    if (device.network_type) {
        line += QLatin1Char(' ') + *device.network_type;
    }
    return line;
}

} // namespace

QString format_device_list(std::vector<Device> devices) {
    sort_devices(devices);

    QStringList out;
    for (const auto& device : devices) {
        out.append(render_device_line(device));
    }
    if (out.isEmpty()) {
        return QStringLiteral("(no devices)\n");
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_device_list_json(std::vector<Device> devices) {
    sort_devices(devices);

    QJsonArray array;
    for (const auto& device : devices) {
        array.append(network::device_to_json(device));
    }
    QJsonObject root;
    root[QStringLiteral("devices")] = array;
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

QString format_conversation_list(const std::vector<sms::Conversation>& conversations, Timestamp now) {
    QStringList out;
    for (const auto& c : conversations) {
        QString line = c.unread ? QStringLiteral("* ") : QStringLiteral("  ");
        line += c.contact_name.isEmpty() ? c.phone_number : c.contact_name;
        if (!c.contact_name.isEmpty() && c.contact_name != c.phone_number) {
            line += QStringLiteral(" (") + c.phone_number + QLatin1Char(')');
        }
        line += QStringLiteral(": ") + sms::truncate_message(c.last_message, kPreviewLength);
        line += QStringLiteral(" [") + sms::format_relative_time(c.timestamp, now) + QLatin1Char(']');
        out.append(line);
    }
    if (out.isEmpty()) {
        return QStringLiteral("(no conversations)\n");
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

} // namespace tether::app
