#include "network/discovery_beacon.hpp"

#include "core/log.hpp"

#include <QTimer>
#include <QUdpSocket>

namespace lanlink::network {

DiscoveryBeacon::DiscoveryBeacon(BeaconConfig config, QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , group_(config_.multicast_group)
    , registry_(config_.instance_id)
    , advertise_timer_(std::make_unique<QTimer>(this))
    , sweep_timer_(std::make_unique<QTimer>(this))
    , notify_timer_(std::make_unique<QTimer>(this))
{
    advertise_timer_->setInterval(config_.advertise_interval_ms);
    sweep_timer_->setInterval(config_.sweep_interval_ms);
    notify_timer_->setSingleShot(true);
    notify_timer_->setInterval(0);

    connect(advertise_timer_.get(), &QTimer::timeout, this, &DiscoveryBeacon::onAdvertiseTick);
    connect(sweep_timer_.get(), &QTimer::timeout, this, &DiscoveryBeacon::onSweepTick);
    connect(notify_timer_.get(), &QTimer::timeout, this, &DiscoveryBeacon::onNotifyTimeout);
}

DiscoveryBeacon::~DiscoveryBeacon() {
    stop();
}

Result<void, Error> DiscoveryBeacon::start() {
    if (socket_) {
        return Result<void, Error>::ok();
    }

    auto socket = std::make_unique<QUdpSocket>(this);
    if (!socket->bind(QHostAddress::AnyIPv4,
                      config_.port,
                      QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        const auto msg = QStringLiteral("discovery bind on port %1 failed: %2")
                             .arg(config_.port)
                             .arg(socket->errorString());
        qCWarning(lcDiscovery).noquote() << msg;
        emit discoveryError(msg);
        return Result<void, Error>::err(Error{ErrorKind::NetworkBindFailure, msg});
    }

    socket->setSocketOption(QAbstractSocket::MulticastTtlOption, 1);
    // Other instances on this host must see us; our own datagrams are filtered by instance id.
    socket->setSocketOption(QAbstractSocket::MulticastLoopbackOption, 1);

    if (!socket->joinMulticastGroup(group_)) {
        const auto msg = QStringLiteral("joining %1 failed: %2")
                             .arg(group_.toString(), socket->errorString());
        qCWarning(lcDiscovery).noquote() << msg;
        emit discoveryError(msg);
        return Result<void, Error>::err(Error{ErrorKind::NetworkBindFailure, msg});
    }

    socket_ = std::move(socket);
    connect(socket_.get(), &QUdpSocket::readyRead, this, &DiscoveryBeacon::onReadyRead);

    qCInfo(lcDiscovery) << "discovery started port=" << config_.port
                        << "group=" << group_.toString()
                        << "ip=" << config_.local_ip
                        << "instance=" << config_.instance_id;

    advertise_timer_->start();
    sweep_timer_->start();
    announceOnce();
    return Result<void, Error>::ok();
}

void DiscoveryBeacon::stop() {
    advertise_timer_->stop();
    sweep_timer_->stop();
    notify_timer_->stop();

    if (!socket_) return;
    socket_->leaveMulticastGroup(group_);
    socket_.reset();

    const bool had_devices = registry_.size() > 0;
    registry_.clear();
    if (had_devices) {
        emit devicesChanged({});
    }
    qCInfo(lcDiscovery) << "discovery stopped";
}

void DiscoveryBeacon::ingestDatagram(const QByteArray& datagram, Timestamp now) {
    auto decoded = decode_discovery_datagram(datagram);
    if (decoded.is_err()) {
        qCDebug(lcDiscovery) << "dropping datagram:" << decoded.unwrap_err().qmessage();
        return;
    }

    if (registry_.upsert(decoded.unwrap(), now)) {
        scheduleNotify();
    }
}

void DiscoveryBeacon::sweep(Timestamp now) {
    if (registry_.expire(now)) {
        scheduleNotify();
    }
}

void DiscoveryBeacon::onReadyRead() {
    if (!socket_) return;

    while (socket_->hasPendingDatagrams()) {
        QByteArray datagram;
        datagram.resize(static_cast<int>(socket_->pendingDatagramSize()));

        QHostAddress sender;
        quint16 sender_port = 0;
        const auto read = socket_->readDatagram(datagram.data(), datagram.size(), &sender, &sender_port);
        Q_UNUSED(sender_port)
        if (read < 0) {
            continue;
        }
        datagram.truncate(static_cast<int>(read));
        ingestDatagram(datagram, Timestamp::now());
    }
}

void DiscoveryBeacon::announceOnce() {
    if (!socket_) return;

    const auto bytes = encode_discovery_datagram(
        Announcement{config_.local_ip, config_.hostname, config_.instance_id});

    if (socket_->writeDatagram(bytes, group_, config_.port) < 0) {
        qCDebug(lcDiscovery) << "multicast announce failed:" << socket_->errorString();
    }

    // Unicast heartbeat for networks that drop multicast in one direction.
    for (const auto& ip : registry_.knownIps()) {
        if (socket_->writeDatagram(bytes, QHostAddress(ip), config_.port) < 0) {
            qCDebug(lcDiscovery) << "unicast announce to" << ip << "failed:" << socket_->errorString();
        }
    }
}

void DiscoveryBeacon::onAdvertiseTick() {
    announceOnce();
}

void DiscoveryBeacon::onSweepTick() {
    sweep(Timestamp::now());
}

void DiscoveryBeacon::scheduleNotify() {
    if (!notify_timer_->isActive()) {
        notify_timer_->start();
    }
}

void DiscoveryBeacon::onNotifyTimeout() {
    const auto devices = registry_.snapshot();
    qCDebug(lcDiscovery) << "devices changed, count=" << devices.size();
    emit devicesChanged(devices);
}

} // namespace lanlink::network
