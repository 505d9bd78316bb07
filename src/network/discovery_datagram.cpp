#include "network/discovery_datagram.hpp"

#include <QHostAddress>
#include <QStringList>

namespace lanlink::network {

QByteArray encode_discovery_datagram(const Announcement& announcement) {
    return QStringLiteral("%1:%2:%3:%4")
        .arg(QString::fromLatin1(kDiscoveryTag),
             announcement.ip,
             announcement.hostname,
             QString::number(announcement.instance_id))
        .toUtf8();
}

Result<Announcement, Error> decode_discovery_datagram(const QByteArray& datagram) {
    const QString text = QString::fromUtf8(datagram).trimmed();
    const QStringList parts = text.split(QLatin1Char(':'));
    if (parts.size() < 4) {
        return Result<Announcement, Error>::err(
            Error{ErrorKind::ProtocolParseError, "too few fields"});
    }
    if (parts.front() != QLatin1String(kDiscoveryTag)) {
        return Result<Announcement, Error>::err(
            Error{ErrorKind::ProtocolParseError, "wrong tag"});
    }

    const QString ip = parts.at(1);
    QHostAddress address;
    if (!address.setAddress(ip) || address.protocol() != QAbstractSocket::IPv4Protocol) {
        return Result<Announcement, Error>::err(
            Error{ErrorKind::ProtocolParseError, "invalid ip"});
    }

    bool ok = false;
    const InstanceId instance_id = parts.back().toULongLong(&ok);
    if (!ok) {
        return Result<Announcement, Error>::err(
            Error{ErrorKind::ProtocolParseError, "invalid instance id"});
    }

    // Host names may themselves contain ':'; everything between ip and id is the name.
    const QString hostname = parts.mid(2, parts.size() - 3).join(QLatin1Char(':'));
    if (hostname.isEmpty()) {
        return Result<Announcement, Error>::err(
            Error{ErrorKind::ProtocolParseError, "empty hostname"});
    }

    return Result<Announcement, Error>::ok(Announcement{ip, hostname, instance_id});
}

} // namespace lanlink::network
