#pragma once

#include "core/device.hpp"
#include "core/types.hpp"
#include <QMutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace tether::network {

/**
 * DeviceCache - Authoritative mapping from DeviceId to last known Device.
 *
 * Every operation holds the same mutex for the length of a copy, so a reader
 * never sees half of an upsert. The cache performs no I/O.
 *
 * Partial updates are the caller's job: read with get(), modify the copy,
 * then upsert() it back.
 */
class DeviceCache {
public:
    DeviceCache() = default;
    DeviceCache(const DeviceCache&) = delete;
    DeviceCache& operator=(const DeviceCache&) = delete;

    /**
     * Snapshot of every cached device, in no particular order.
     */
    [[nodiscard]] std::vector<Device> getAll() const;

    [[nodiscard]] std::optional<Device> get(const DeviceId& id) const;
    [[nodiscard]] bool contains(const DeviceId& id) const;
    [[nodiscard]] size_t size() const;

    /**
     * Insert or fully replace the record keyed by device.id.
     */
    void upsert(const Device& device);

    /**
     * Remove a device. Returns false if it was not cached.
     */
    bool remove(const DeviceId& id);

private:
    mutable QMutex mu_;
    std::unordered_map<DeviceId, Device> devices_;
};

} // namespace tether::network
