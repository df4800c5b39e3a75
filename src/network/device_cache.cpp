#include "network/device_cache.hpp"

#include <QMutexLocker>

namespace tether::network {

std::vector<Device> DeviceCache::getAll() const {
    QMutexLocker lock(&mu_);
    std::vector<Device> out;
    out.reserve(devices_.size());
    for (const auto& [id, device] : devices_) {
        out.push_back(device);
    }
    return out;
}

std::optional<Device> DeviceCache::get(const DeviceId& id) const {
    QMutexLocker lock(&mu_);
    auto it = devices_.find(id);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool DeviceCache::contains(const DeviceId& id) const {
    QMutexLocker lock(&mu_);
    return devices_.find(id) != devices_.end();
}

size_t DeviceCache::size() const {
    QMutexLocker lock(&mu_);
    return devices_.size();
}

void DeviceCache::upsert(const Device& device) {
    QMutexLocker lock(&mu_);
    devices_.insert_or_assign(device.id, device);
}

bool DeviceCache::remove(const DeviceId& id) {
    QMutexLocker lock(&mu_);
    return devices_.erase(id) > 0;
}

} // namespace tether::network
