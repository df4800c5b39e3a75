#include "sms/phone_number.hpp"

namespace tether::sms {
namespace {

constexpr qsizetype kUsNumberLength = 10;
constexpr qsizetype kLocalSuffixLength = 7;

bool is_us_prefixed(const QString& shorter, const QString& longer) {
    return shorter.size() == kUsNumberLength
        && longer.size() == kUsNumberLength + 1
        && longer.startsWith(QLatin1Char('1'))
        && QStringView(longer).mid(1) == shorter;
}

} // namespace

QString normalize_phone_number(const QString& phone) {
    QString digits;
    digits.reserve(phone.size());
    for (const QChar c : phone) {
        if (c >= QLatin1Char('0') && c <= QLatin1Char('9')) {
            digits.append(c);
        }
    }
    return digits;
}

bool phone_numbers_match(const QString& a, const QString& b) {
    const QString na = normalize_phone_number(a);
    const QString nb = normalize_phone_number(b);

    if (na == nb) {
        return true;
    }
    if (is_us_prefixed(na, nb) || is_us_prefixed(nb, na)) {
        return true;
    }
    if (na.size() >= kLocalSuffixLength && nb.size() >= kLocalSuffixLength) {
        return QStringView(na).right(kLocalSuffixLength) == QStringView(nb).right(kLocalSuffixLength);
    }
    return false;
}

} // namespace tether::sms
