#pragma once

#include <QHash>
#include <QMetaType>
#include <QString>
#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>

namespace tether {

/**
 * DeviceId - Opaque, stable identifier the Core assigns to a remote device.
 *
 * Equality is exact string equality; no normalization is applied.
 */
class DeviceId {
public:
    DeviceId() = default;
    explicit DeviceId(QString value) : value_(std::move(value)) {}

    [[nodiscard]] const QString& value() const noexcept { return value_; }
    [[nodiscard]] bool is_empty() const noexcept { return value_.isEmpty(); }

    bool operator==(const DeviceId& other) const { return value_ == other.value_; }
    std::strong_ordering operator<=>(const DeviceId& other) const {
        const int c = QString::compare(value_, other.value_, Qt::CaseSensitive);
        if (c < 0) return std::strong_ordering::less;
        if (c > 0) return std::strong_ordering::greater;
        return std::strong_ordering::equal;
    }

private:
    QString value_;
};

inline size_t qHash(const DeviceId& id, size_t seed = 0) noexcept {
    return ::qHash(id.value(), seed);
}

/**
 * Timestamp - Milliseconds since the Unix epoch.
 *
 * SMS dates arrive from the phone in this unit, so it is kept as-is.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::duration_cast<Duration>(
            Clock::now().time_since_epoch()).count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return Timestamp(millis_ + d.count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

/**
 * Clock source, injectable so timing logic can be tested without sleeping.
 */
using ClockFn = std::function<Timestamp()>;

} // namespace tether

namespace std {
    template<>
    struct hash<tether::DeviceId> {
        size_t operator()(const tether::DeviceId& id) const noexcept {
            return ::qHash(id.value());
        }
    };
}

Q_DECLARE_METATYPE(tether::DeviceId)
