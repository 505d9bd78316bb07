#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <QByteArray>
#include <QString>

namespace lanlink::network {

/**
 * Presence advertisement carried by one discovery datagram.
 */
struct Announcement {
    QString ip;
    QString hostname;
    InstanceId instance_id = 0;

    bool operator==(const Announcement&) const = default;
};

// Wire format: "FILETRANSFER:<ip>:<hostname>:<instance_id>".
// Kept apart from DiscoveryBeacon so encode/decode is testable without sockets.
inline constexpr const char* kDiscoveryTag = "FILETRANSFER";

QByteArray encode_discovery_datagram(const Announcement& announcement);

Result<Announcement, Error> decode_discovery_datagram(const QByteArray& datagram);

} // namespace lanlink::network
