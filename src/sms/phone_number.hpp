#pragma once

#include <QString>

namespace tether::sms {

/**
 * Strip everything but ASCII digits: "+1 (555) 123-4567" -> "15551234567".
 */
[[nodiscard]] QString normalize_phone_number(const QString& phone);

/**
 * Loose phone number equality used for contact lookup and chat lookup.
 *
 * Two numbers match when their digit forms are equal, when one is the other
 * with a leading US country code "1" in front of ten digits, or when both
 * have at least seven digits and the last seven agree.
 *
 * Reflexive and symmetric but NOT transitive: never build equivalence
 * classes out of it.
 */
[[nodiscard]] bool phone_numbers_match(const QString& a, const QString& b);

} // namespace tether::sms
