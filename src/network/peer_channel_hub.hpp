#pragma once

#include "core/result.hpp"
#include "network/transport.hpp"

#include <QMutex>
#include <QObject>
#include <QPointer>
#include <QStringList>

#include <map>
#include <memory>
#include <optional>

namespace lanlink::network {

struct HubConfig {
    QString name;
    quint16 listen_port = 0;
    // Port dialed on peers; every node normally uses the same one.
    quint16 peer_port = 0;
    QString local_ip;
    int dial_timeout_ms = 5000;
};

/**
 * PeerChannelHub - map of peer IP to one logical text channel.
 *
 * Runs an acceptor and a connector at the same time. A logical channel to a
 * peer may consist of an accepted leg, a dialed leg, or both; outgoing text
 * prefers the dialed leg. A new leg of the same role replaces the old one, so
 * a reconnect never duplicates the entry. When either leg closes, the whole
 * channel is torn down and peerDisconnected() fires once.
 *
 * WebSocket pings are answered by QWebSocket itself.
 */
class PeerChannelHub : public QObject {
    Q_OBJECT

public:
    explicit PeerChannelHub(HubConfig config, QObject* parent = nullptr);
    ~PeerChannelHub() override;

    /**
     * Start the acceptor. Idempotent.
     * @return the port being listened on
     */
    Result<quint16, Error> listen();
    void stopListening();
    [[nodiscard]] bool isListening() const;
    [[nodiscard]] quint16 listenPort() const;

    /**
     * Open a client-role leg to `ip`. The outcome arrives as peerConnected()
     * or dialFailed(). A no-op when a dialed leg exists or is being opened.
     * @param port 0 dials the configured peer port
     */
    Result<void, Error> dial(const QString& ip, quint16 port = 0);

    Result<void, Error> sendText(const QString& ip, const QString& text);

    /**
     * Send to every connected peer. Peers whose send fails are dropped.
     * @return the IPs the text was handed to
     */
    QStringList broadcastText(const QString& text);

    void closePeer(const QString& ip);
    void closeAll();

    [[nodiscard]] bool isConnected(const QString& ip) const;
    [[nodiscard]] bool hasDialedLeg(const QString& ip) const;
    [[nodiscard]] bool isDialing(const QString& ip) const;
    [[nodiscard]] QStringList peers() const;
    [[nodiscard]] const HubConfig& config() const { return config_; }

signals:
    /**
     * A leg was attached. `first_leg` is true when the peer was not connected before.
     */
    void peerConnected(const QString& ip, lanlink::network::LinkRole role, bool first_leg);
    void peerDisconnected(const QString& ip);
    void dialFailed(const QString& ip, const lanlink::Error& error);
    void textReceived(const QString& ip, const QString& text);
    void serverError(const QString& message);

private slots:
    void onAccepted(QWebSocket* socket);

private:
    struct Channel {
        std::optional<PeerLink> accepted;
        std::optional<PeerLink> dialed;

        [[nodiscard]] std::optional<PeerLink> writer() const;
        [[nodiscard]] bool owns(const QWebSocket* socket) const;
    };

    void wireSocket(QWebSocket* socket, const QString& ip);
    void attach(const QString& ip, PeerLink link);
    void onLinkClosed(const QString& ip, QWebSocket* socket);
    void finishDial(const QString& ip, QWebSocket* socket, const Error& error);
    void retire(QWebSocket* socket);

    HubConfig config_;
    std::unique_ptr<WsServer> server_;

    mutable QMutex mu_;
    std::map<QString, Channel> channels_;
    std::map<QString, QPointer<QWebSocket>> pending_dials_;
};

} // namespace lanlink::network
