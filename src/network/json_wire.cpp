#include "network/json_wire.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonValue>
#include <QString>
#include <type_traits>

namespace tether::network {
namespace {

using CapabilityFlag = bool Capabilities::*;

struct CapabilityName {
    const char* name;
    CapabilityFlag flag;
};

constexpr CapabilityName kCapabilities[] = {
    {"battery", &Capabilities::battery},
    {"ping", &Capabilities::ping},
    {"share", &Capabilities::share},
    {"sftp", &Capabilities::sftp},
    {"sms", &Capabilities::sms},
    {"contacts", &Capabilities::contacts},
    {"clipboard", &Capabilities::clipboard},
    {"findmyphone", &Capabilities::findmyphone},
    {"mpris", &Capabilities::mpris},
    {"remotekeyboard", &Capabilities::remote_keyboard},
    {"presenter", &Capabilities::presenter},
    {"lockdevice", &Capabilities::lockdevice},
    {"virtualmonitor", &Capabilities::virtualmonitor},
    {"runcommand", &Capabilities::runcommand},
};

QString latin1(std::string_view text) {
    return QString::fromLatin1(text.data(), static_cast<qsizetype>(text.size()));
}

Result<events::CoreEvent, Error> malformed(const char* message) {
    return Result<events::CoreEvent, Error>::err(Error{message, ErrorCode::MalformedPayload});
}

Capabilities capabilities_from_json(const QJsonArray& names) {
    Capabilities caps;
    for (const auto& value : names) {
        auto name = value.toString();
        // Plugin ids arrive either bare or as kdeconnect_<name>.
        if (name.startsWith(QLatin1String("kdeconnect_"))) {
            name = name.mid(11);
        }
        for (const auto& entry : kCapabilities) {
            if (name == QLatin1String(entry.name)) {
                caps.*(entry.flag) = true;
            }
        }
    }
    return caps;
}

QJsonArray capabilities_to_json(const Capabilities& caps) {
    QJsonArray names;
    for (const auto& entry : kCapabilities) {
        if (caps.*(entry.flag)) {
            names.append(QString::fromLatin1(entry.name));
        }
    }
    return names;
}

// SMS and contacts bodies stay raw; the SMS engine decodes and validates
// them so a bad batch is rejected there.
QByteArray raw_payload(const QJsonValue& value) {
    if (value.isObject()) {
        return QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact);
    }
    if (value.isArray()) {
        return QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact);
    }
    return value.toString().toUtf8();
}

QJsonObject body_for(const commands::CoreCommand& command) {
    using namespace commands;

    return std::visit([](const auto& c) -> QJsonObject {
        using T = std::decay_t<decltype(c)>;
        QJsonObject body;

        if constexpr (std::is_same_v<T, Ping>) {
            body["message"] = c.message;
        } else if constexpr (std::is_same_v<T, SendFiles>) {
            body["filenames"] = QJsonArray::fromStringList(c.paths);
        } else if constexpr (std::is_same_v<T, SendClipboard>) {
            body["content"] = c.content;
        } else if constexpr (std::is_same_v<T, RequestConversation>) {
            body["requestConversation"] = c.thread_id;
        } else if constexpr (std::is_same_v<T, SendSms>) {
            body["sendSms"] = true;
            body["phoneNumber"] = c.phone_number;
            body["messageBody"] = c.message;
        } else if constexpr (std::is_same_v<T, StartSftpBrowsing>) {
            body["startBrowsing"] = true;
        } else if constexpr (std::is_same_v<T, ExecuteCommand>) {
            body["key"] = c.command_key;
        } else if constexpr (std::is_same_v<T, RequestCommandList>) {
            body["requestCommandList"] = true;
        } else if constexpr (std::is_same_v<T, RequestBatteryStatus>) {
            body["request"] = true;
        }
        return body;
    }, command);
}

const char* packet_type_for(const commands::CoreCommand& command) {
    using namespace commands;

    return std::visit([](const auto& c) -> const char* {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, Pair>) return "pair";
        else if constexpr (std::is_same_v<T, Unpair>) return "unpair";
        else if constexpr (std::is_same_v<T, Ping>) return "kdeconnect.ping";
        else if constexpr (std::is_same_v<T, SendFiles>) return "kdeconnect.share.request";
        else if constexpr (std::is_same_v<T, SendClipboard>) return "kdeconnect.clipboard";
        else if constexpr (std::is_same_v<T, RequestConversations>) return "kdeconnect.sms.request_conversations";
        else if constexpr (std::is_same_v<T, RequestConversation>) return "kdeconnect.sms.request";
        else if constexpr (std::is_same_v<T, SendSms>) return "kdeconnect.sms.request";
        else if constexpr (std::is_same_v<T, StartSftpBrowsing>) return "kdeconnect.sftp.request";
        else if constexpr (std::is_same_v<T, ExecuteCommand>) return "kdeconnect.runcommand.request";
        else if constexpr (std::is_same_v<T, RequestCommandList>) return "kdeconnect.runcommand.request";
        else if constexpr (std::is_same_v<T, RequestBatteryStatus>) return "kdeconnect.battery.request";
    }, command);
}

} // namespace

Result<Device, Error> device_from_json(const QJsonObject& obj, const DeviceId& fallback_id) {
    Device device;
    const auto id = obj["id"].toString();
    device.id = id.isEmpty() ? fallback_id : DeviceId(id);
    if (device.id.is_empty()) {
        return Result<Device, Error>::err(Error{"device without id", ErrorCode::MalformedPayload});
    }

    device.name = obj["name"].toString();
    device.type = parse_device_type(obj["deviceType"].toString().toStdString());

    if (obj.contains("pairState")) {
        auto state = parse_pair_state(obj["pairState"].toString().toStdString());
        if (!state) {
            return Result<Device, Error>::err(Error{"unknown pair state", ErrorCode::MalformedPayload});
        }
        device.pair_state = *state;
    } else if (obj["isPaired"].toBool()) {
        device.pair_state = PairState::Paired;
    }

    device.reachable = obj["reachable"].toBool(true);
    device.capabilities = capabilities_from_json(obj["capabilities"].toArray());

    if (obj["batteryLevel"].isDouble()) {
        device.battery_level = checked_battery_level(obj["batteryLevel"].toInt(-1));
    }
    if (obj["isCharging"].isBool()) {
        device.charging = obj["isCharging"].toBool();
    }
    if (obj["signalStrength"].isDouble()) {
        device.signal_strength = checked_signal_strength(obj["signalStrength"].toInt(-2));
    }
    if (obj["networkType"].isString()) {
        device.network_type = obj["networkType"].toString();
    }

    return Result<Device, Error>::ok(std::move(device));
}

QJsonObject device_to_json(const Device& device) {
    QJsonObject obj;
    obj["id"] = device.id.value();
    obj["name"] = device.name;
    obj["deviceType"] = latin1(device_type_name(device.type));
    obj["pairState"] = latin1(pair_state_name(device.pair_state));
    obj["reachable"] = device.reachable;
    obj["capabilities"] = capabilities_to_json(device.capabilities);
    if (device.battery_level) obj["batteryLevel"] = *device.battery_level;
    if (device.charging) obj["isCharging"] = *device.charging;
    if (device.signal_strength) obj["signalStrength"] = *device.signal_strength;
    if (device.network_type) obj["networkType"] = *device.network_type;
    return obj;
}

Result<events::CoreEvent, Error> decode_core_event(const QByteArray& line) {
    QJsonParseError parse_error;
    const auto doc = QJsonDocument::fromJson(line, &parse_error);
    if (doc.isNull() || !doc.isObject()) {
        return malformed("invalid json");
    }

    const auto obj = doc.object();
    const auto kind = obj["event"].toString();
    const DeviceId id(obj["deviceId"].toString());

    if (kind == QLatin1String("clipboard")) {
        return Result<events::CoreEvent, Error>::ok(events::ClipboardReceived{obj["content"].toString()});
    }

    if (id.is_empty()) {
        return malformed("missing deviceId");
    }

    if (kind == QLatin1String("connected") || kind == QLatin1String("paired")) {
        auto device = device_from_json(obj["device"].toObject(), id);
        if (device.is_err()) {
            return Result<events::CoreEvent, Error>::err(device.unwrap_err());
        }
        if (kind == QLatin1String("connected")) {
            return Result<events::CoreEvent, Error>::ok(events::Connected{id, std::move(device).unwrap()});
        }
        return Result<events::CoreEvent, Error>::ok(events::DevicePaired{id, std::move(device).unwrap()});
    }
    if (kind == QLatin1String("disconnected")) {
        return Result<events::CoreEvent, Error>::ok(events::Disconnected{id});
    }
    if (kind == QLatin1String("pairState")) {
        auto state = parse_pair_state(obj["state"].toString().toStdString());
        if (!state) {
            return malformed("unknown pair state");
        }
        return Result<events::CoreEvent, Error>::ok(events::PairStateChanged{id, *state});
    }
    if (kind == QLatin1String("state")) {
        return Result<events::CoreEvent, Error>::ok(events::StateUpdated{id, obj["state"].toObject()});
    }
    if (kind == QLatin1String("mpris")) {
        return Result<events::CoreEvent, Error>::ok(events::Mpris{id, obj["payload"].toObject()});
    }
    if (kind == QLatin1String("sms")) {
        return Result<events::CoreEvent, Error>::ok(events::SmsMessages{id, raw_payload(obj["payload"])});
    }
    if (kind == QLatin1String("contacts")) {
        return Result<events::CoreEvent, Error>::ok(events::ContactsReceived{id, raw_payload(obj["payload"])});
    }

    return malformed("unknown event type");
}

QByteArray encode_request(const commands::Request& request) {
    QJsonObject obj;
    obj["deviceId"] = request.device.value();
    obj["type"] = QString::fromLatin1(packet_type_for(request.command));
    obj["body"] = body_for(request.command);
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

} // namespace tether::network
