#include "network/peer_registry.hpp"

#include <QMutexLocker>

#include <algorithm>

namespace lanlink::network {

PeerRegistry::PeerRegistry(InstanceId local_instance_id)
    : local_instance_id_(local_instance_id) {}

bool PeerRegistry::upsert(const Announcement& announcement, Timestamp now) {
    if (announcement.instance_id == local_instance_id_) {
        return false;
    }

    QMutexLocker lock(&mu_);
    auto it = devices_.find(announcement.ip);
    if (it == devices_.end()) {
        devices_.emplace(announcement.ip,
                         Device{announcement.ip, announcement.hostname,
                                announcement.instance_id, now});
        return true;
    }

    auto& device = it->second;
    const bool changed = device.hostname != announcement.hostname ||
                         device.instance_id != announcement.instance_id;
    device.hostname = announcement.hostname;
    device.instance_id = announcement.instance_id;
    device.last_seen = std::max(device.last_seen, now);
    return changed;
}

bool PeerRegistry::expire(Timestamp now) {
    QMutexLocker lock(&mu_);
    bool removed = false;
    for (auto it = devices_.begin(); it != devices_.end();) {
        if (now - it->second.last_seen > kStaleAfter) {
            it = devices_.erase(it);
            removed = true;
        } else {
            ++it;
        }
    }
    return removed;
}

void PeerRegistry::clear() {
    QMutexLocker lock(&mu_);
    devices_.clear();
}

std::vector<Device> PeerRegistry::snapshot() const {
    QMutexLocker lock(&mu_);
    std::vector<Device> out;
    out.reserve(devices_.size());
    for (const auto& [ip, device] : devices_) {
        out.push_back(device);
    }
    return out;
}

std::optional<Device> PeerRegistry::find(const QString& ip) const {
    QMutexLocker lock(&mu_);
    auto it = devices_.find(ip);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

QStringList PeerRegistry::knownIps() const {
    QMutexLocker lock(&mu_);
    QStringList ips;
    for (const auto& [ip, device] : devices_) {
        ips.append(ip);
    }
    return ips;
}

size_t PeerRegistry::size() const {
    QMutexLocker lock(&mu_);
    return devices_.size();
}

} // namespace lanlink::network
