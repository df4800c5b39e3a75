#pragma once

#include "core/result.hpp"
#include "sms/models.hpp"
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <optional>

namespace tether::sms {

/**
 * VCard - The two fields the SMS window cares about.
 */
struct VCard {
    std::optional<QString> name;
    QStringList phone_numbers;

    bool operator==(const VCard&) const = default;
};

/**
 * Extract the display name (FN:, else "Given Family" from N:) and every
 * TEL number from a vCard.
 */
[[nodiscard]] VCard parse_vcard(const QString& content);

/**
 * Decode a `kdeconnect.contacts.response_vcards` body: a JSON object of
 * uid -> vCard text. Cards without a name or number are skipped; anything
 * that is not an object is a MalformedPayload error.
 */
[[nodiscard]] Result<ContactsMap, Error> parse_contacts_payload(const QByteArray& payload);

/**
 * First contact whose number matches `phone_number`, if any.
 */
[[nodiscard]] std::optional<QString> resolve_contact_name(const ContactsMap& contacts,
                                                          const QString& phone_number);

} // namespace tether::sms
