#include "network/local_address.hpp"

#include <QNetworkInterface>
#include <QUdpSocket>

namespace lanlink::network {

namespace {
const QHostAddress kRouteProbe(QStringLiteral("8.8.8.8"));
constexpr quint16 kRouteProbePort = 80;
} // namespace

QString detect_local_ip() {
    {
        QUdpSocket probe;
        // A UDP "connect" only selects a route; nothing goes on the wire.
        probe.connectToHost(kRouteProbe, kRouteProbePort);
        if (probe.waitForConnected(200)) {
            const QHostAddress local = probe.localAddress();
            if (local.protocol() == QAbstractSocket::IPv4Protocol && !local.isLoopback() &&
                !local.isNull()) {
                return local.toString();
            }
        }
    }

    for (const QHostAddress& address : QNetworkInterface::allAddresses()) {
        if (address.protocol() == QAbstractSocket::IPv4Protocol && !address.isLoopback()) {
            return address.toString();
        }
    }
    return QStringLiteral("127.0.0.1");
}

QString normalize_peer_ip(const QHostAddress& address, const QString& local_ip) {
    bool is_v4 = false;
    const quint32 v4 = address.toIPv4Address(&is_v4);
    const QHostAddress plain = is_v4 ? QHostAddress(v4) : address;

    if (plain.isLoopback() && !local_ip.isEmpty()) {
        return local_ip;
    }
    return plain.toString();
}

} // namespace lanlink::network
