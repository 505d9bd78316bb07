#pragma once

#include <QHostAddress>
#include <QString>

namespace lanlink::network {

/**
 * Best guess at this node's LAN IPv4 address.
 *
 * Asks the routing table which local address would reach a public host
 * (no packet is sent), then falls back to the first non-loopback IPv4
 * interface address, then to 127.0.0.1.
 */
QString detect_local_ip();

/**
 * Key a remote socket address for connection maps: strips IPv4-mapped IPv6
 * prefixes and maps loopback peers to `local_ip`.
 */
QString normalize_peer_ip(const QHostAddress& address, const QString& local_ip);

} // namespace lanlink::network
