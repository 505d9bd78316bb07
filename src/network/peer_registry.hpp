#pragma once

#include "core/types.hpp"
#include "network/discovery_datagram.hpp"

#include <QMetaType>
#include <QMutex>
#include <QString>
#include <QStringList>

#include <chrono>
#include <map>
#include <optional>
#include <vector>

namespace lanlink::network {

/**
 * A device seen on the LAN. Unique by ip.
 */
struct Device {
    QString ip;
    QString hostname;
    InstanceId instance_id = 0;
    Timestamp last_seen;
};

/**
 * PeerRegistry - known devices and their freshness.
 *
 * Mutations report whether the visible device set changed, so the owner
 * can batch them into a single "devices changed" notification.
 */
class PeerRegistry {
public:
    static constexpr std::chrono::milliseconds kStaleAfter{30000};

    explicit PeerRegistry(InstanceId local_instance_id);

    /**
     * Record an announcement seen at `now`.
     * Announcements carrying the local instance id are ignored.
     * @return true if a device appeared or its hostname/instance changed
     */
    bool upsert(const Announcement& announcement, Timestamp now);

    /**
     * Drop devices not seen for more than kStaleAfter.
     * @return true if anything was removed
     */
    bool expire(Timestamp now);

    void clear();

    /**
     * Consistent copy of the table, ordered by ip.
     */
    [[nodiscard]] std::vector<Device> snapshot() const;
    [[nodiscard]] std::optional<Device> find(const QString& ip) const;
    [[nodiscard]] QStringList knownIps() const;
    [[nodiscard]] size_t size() const;

private:
    const InstanceId local_instance_id_;
    mutable QMutex mu_;
    std::map<QString, Device> devices_;
};

} // namespace lanlink::network

Q_DECLARE_METATYPE(lanlink::network::Device)
