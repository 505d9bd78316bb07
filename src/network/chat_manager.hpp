#pragma once

#include "core/result.hpp"
#include "network/messages.hpp"
#include "network/peer_channel_hub.hpp"

#include <QObject>

#include <memory>

namespace lanlink::network {

struct ChatConfig {
    quint16 listen_port = kDefaultChatPort;
    quint16 peer_port = kDefaultChatPort;
    QString local_ip;
    int reconnect_delay_ms = 300;
};

/**
 * ChatConnectionManager - chat over one text channel per peer, plus the
 * single-session policy that keeps both directions of the active chat alive.
 *
 * Session policy:
 * - With no active chat, an unsolicited inbound connection makes that peer
 *   the active one (auto-accept) and a connection back is opened after
 *   reconnect_delay_ms.
 * - For the active peer, an inbound connection while we hold no outbound
 *   leg (the peer reconnected after a drop) also triggers a connect-back.
 * - A drop of the active peer keeps it active but marks it disconnected.
 */
class ChatConnectionManager : public QObject {
    Q_OBJECT

public:
    explicit ChatConnectionManager(ChatConfig config, QObject* parent = nullptr);
    ~ChatConnectionManager() override;

    /**
     * Start the acceptor. Idempotent; bind failures are also reported via chatServerError().
     */
    Result<quint16, Error> start();
    void stop();

    /**
     * Connect to a peer. Returns immediately if a connection already exists;
     * the outcome is reported by chatConnected() or chatConnectFailed().
     */
    Result<void, Error> connectTo(const QString& ip, quint16 port = 0);

    /**
     * Send a chat line. Fails with NotConnected when no live connection exists.
     */
    Result<ChatMessage, Error> send(const QString& ip, const QString& content);

    void disconnectPeer(const QString& ip);
    void disconnectAll();

    /**
     * Operator picked a peer to chat with: make it active and connect.
     */
    Result<void, Error> openSession(const QString& ip);
    void closeSession();

    [[nodiscard]] QString activePeer() const { return active_peer_; }
    [[nodiscard]] bool isSessionConnected() const { return session_connected_; }
    [[nodiscard]] bool isConnected(const QString& ip) const { return hub_->isConnected(ip); }
    [[nodiscard]] QStringList peers() const { return hub_->peers(); }
    [[nodiscard]] quint16 listenPort() const { return hub_->listenPort(); }
    [[nodiscard]] const ChatConfig& config() const { return config_; }

signals:
    void chatConnected(const QString& ip);
    void chatDisconnected(const QString& ip);
    void chatMessageReceived(const lanlink::network::ChatMessage& message);
    void chatServerError(const QString& message);
    void chatConnectFailed(const QString& ip, const QString& message);
    void sessionChanged(const QString& peer_ip, bool connected);

private slots:
    void onPeerConnected(const QString& ip, lanlink::network::LinkRole role, bool first_leg);
    void onPeerDisconnected(const QString& ip);
    void onTextReceived(const QString& ip, const QString& text);
    void onDialFailed(const QString& ip, const lanlink::Error& error);

private:
    void scheduleConnectBack(const QString& ip);
    void setSession(const QString& ip, bool connected);

    ChatConfig config_;
    std::unique_ptr<PeerChannelHub> hub_;

    QString active_peer_;
    bool session_connected_ = false;
};

} // namespace lanlink::network
