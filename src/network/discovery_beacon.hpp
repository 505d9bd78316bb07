#pragma once

#include "core/result.hpp"
#include "network/peer_registry.hpp"

#include <QHostAddress>
#include <QObject>

#include <memory>
#include <vector>

class QUdpSocket;
class QTimer;

namespace lanlink::network {

constexpr quint16 kDefaultDiscoveryPort = 37821;
inline constexpr const char* kDefaultMulticastGroup = "239.255.77.88";

struct BeaconConfig {
    quint16 port = kDefaultDiscoveryPort;
    QString multicast_group = QString::fromLatin1(kDefaultMulticastGroup);
    int advertise_interval_ms = 3000;
    int sweep_interval_ms = 1000;
    QString local_ip;
    QString hostname;
    InstanceId instance_id = 0;
};

/**
 * DiscoveryBeacon - UDP multicast presence advertise/listen loop.
 *
 * Every advertise tick sends one datagram to the multicast group and unicasts
 * the same datagram to every known device. Received datagrams update the
 * PeerRegistry; a sweep drops stale devices. Net changes to the device set are
 * coalesced into one devicesChanged() per event-loop pass.
 */
class DiscoveryBeacon final : public QObject {
    Q_OBJECT

public:
    explicit DiscoveryBeacon(BeaconConfig config, QObject* parent = nullptr);
    ~DiscoveryBeacon() override;

    /**
     * Bind, join the group and start advertising. Calling it while running is
     * a no-op. A bind or join failure is reported once and not retried.
     */
    Result<void, Error> start();
    void stop();

    [[nodiscard]] bool isRunning() const { return socket_ != nullptr; }
    [[nodiscard]] std::vector<Device> devices() const { return registry_.snapshot(); }
    [[nodiscard]] const PeerRegistry& registry() const { return registry_; }
    [[nodiscard]] const BeaconConfig& config() const { return config_; }

    /**
     * Feed one received datagram observed at `now`. Malformed input is dropped.
     */
    void ingestDatagram(const QByteArray& datagram, Timestamp now);

    /**
     * Run one expiry sweep at `now`.
     */
    void sweep(Timestamp now);

signals:
    void devicesChanged(const std::vector<lanlink::network::Device>& devices);
    void discoveryError(const QString& message);

private slots:
    void onReadyRead();
    void onAdvertiseTick();
    void onSweepTick();
    void onNotifyTimeout();

private:
    void announceOnce();
    void scheduleNotify();

    BeaconConfig config_;
    QHostAddress group_;
    PeerRegistry registry_;

    std::unique_ptr<QUdpSocket> socket_;
    std::unique_ptr<QTimer> advertise_timer_;
    std::unique_ptr<QTimer> sweep_timer_;
    std::unique_ptr<QTimer> notify_timer_;
};

} // namespace lanlink::network
