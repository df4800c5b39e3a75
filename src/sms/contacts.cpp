#include "sms/contacts.hpp"
#include "sms/phone_number.hpp"

#include <QJsonDocument>
#include <QJsonObject>

namespace tether::sms {

VCard parse_vcard(const QString& content) {
    VCard card;

    const auto lines = content.split(QLatin1Char('\n'));
    for (const auto& raw : lines) {
        const QString line = raw.trimmed();

        if (line.startsWith(QLatin1String("FN:"))) {
            card.name = line.mid(3).trimmed();
        } else if (!card.name && line.startsWith(QLatin1String("N:"))) {
            // Family;Given;Middle;Prefix;Suffix
            const auto parts = line.mid(2).split(QLatin1Char(';'));
            if (parts.size() >= 2) {
                const QString full = (parts[1].trimmed() + QLatin1Char(' ') + parts[0].trimmed()).trimmed();
                if (!full.isEmpty()) {
                    card.name = full;
                }
            }
        } else if (line.startsWith(QLatin1String("TEL"))) {
            const auto colon = line.lastIndexOf(QLatin1Char(':'));
            if (colon >= 0) {
                const QString phone = line.mid(colon + 1).trimmed();
                if (!phone.isEmpty()) {
                    card.phone_numbers.append(phone);
                }
            }
        }
    }

    return card;
}

Result<ContactsMap, Error> parse_contacts_payload(const QByteArray& payload) {
    QJsonParseError parse_error;
    const auto doc = QJsonDocument::fromJson(payload, &parse_error);
    if (doc.isNull() || !doc.isObject()) {
        return Result<ContactsMap, Error>::err(
            Error{"contacts payload is not a JSON object", ErrorCode::MalformedPayload});
    }

    ContactsMap contacts;
    const auto obj = doc.object();
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!it.value().isString()) {
            continue;
        }
        const auto card = parse_vcard(it.value().toString());
        if (!card.name || card.name->isEmpty()) {
            continue;
        }
        for (const auto& phone : card.phone_numbers) {
            contacts.insert(phone, *card.name);
        }
    }

    return Result<ContactsMap, Error>::ok(std::move(contacts));
}

std::optional<QString> resolve_contact_name(const ContactsMap& contacts, const QString& phone_number) {
    for (auto it = contacts.cbegin(); it != contacts.cend(); ++it) {
        if (phone_numbers_match(phone_number, it.key())) {
            return it.value();
        }
    }
    return std::nullopt;
}

} // namespace tether::sms
