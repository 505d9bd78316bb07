#include "network/chat_manager.hpp"

#include "core/log.hpp"

#include <QDateTime>
#include <QTimer>

namespace lanlink::network {

ChatConnectionManager::ChatConnectionManager(ChatConfig config, QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , hub_(std::make_unique<PeerChannelHub>(
          HubConfig{.name = QStringLiteral("chat"),
                    .listen_port = config_.listen_port,
                    .peer_port = config_.peer_port,
                    .local_ip = config_.local_ip},
          this))
{
    connect(hub_.get(), &PeerChannelHub::peerConnected,
            this, &ChatConnectionManager::onPeerConnected);
    connect(hub_.get(), &PeerChannelHub::peerDisconnected,
            this, &ChatConnectionManager::onPeerDisconnected);
    connect(hub_.get(), &PeerChannelHub::textReceived,
            this, &ChatConnectionManager::onTextReceived);
    connect(hub_.get(), &PeerChannelHub::dialFailed,
            this, &ChatConnectionManager::onDialFailed);
    connect(hub_.get(), &PeerChannelHub::serverError,
            this, &ChatConnectionManager::chatServerError);
}

ChatConnectionManager::~ChatConnectionManager() = default;

Result<quint16, Error> ChatConnectionManager::start() {
    auto result = hub_->listen();
    if (result.is_ok()) {
        qCInfo(lcChat) << "chat listening on port" << result.unwrap();
    } else {
        qCWarning(lcChat).noquote() << result.unwrap_err().qmessage();
    }
    return result;
}

void ChatConnectionManager::stop() {
    hub_->stopListening();
    hub_->closeAll();
}

Result<void, Error> ChatConnectionManager::connectTo(const QString& ip, quint16 port) {
    qCDebug(lcChat) << "connect to" << ip;
    return hub_->dial(ip, port);
}

Result<ChatMessage, Error> ChatConnectionManager::send(const QString& ip, const QString& content) {
    ChatMessage message{content, config_.local_ip, QDateTime::currentMSecsSinceEpoch()};
    auto sent = hub_->sendText(ip, encode_chat_message(message));
    if (sent.is_err()) {
        qCWarning(lcChat).noquote() << sent.unwrap_err().qmessage();
        return Result<ChatMessage, Error>::err(sent.unwrap_err());
    }
    return Result<ChatMessage, Error>::ok(std::move(message));
}

void ChatConnectionManager::disconnectPeer(const QString& ip) {
    hub_->closePeer(ip);
}

void ChatConnectionManager::disconnectAll() {
    hub_->closeAll();
}

Result<void, Error> ChatConnectionManager::openSession(const QString& ip) {
    auto dialed = hub_->dial(ip);
    if (dialed.is_err()) {
        return dialed;
    }
    setSession(ip, hub_->isConnected(ip));
    return Result<void, Error>::ok();
}

void ChatConnectionManager::closeSession() {
    const QString peer = active_peer_;
    setSession(QString(), false);
    if (!peer.isEmpty()) {
        hub_->closePeer(peer);
    }
}

void ChatConnectionManager::setSession(const QString& ip, bool connected) {
    if (active_peer_ == ip && session_connected_ == connected) {
        return;
    }
    active_peer_ = ip;
    session_connected_ = connected;
    emit sessionChanged(active_peer_, session_connected_);
}

void ChatConnectionManager::onPeerConnected(const QString& ip, LinkRole role, bool first_leg) {
    qCDebug(lcChat) << "leg attached" << ip
                    << (role == LinkRole::Accepted ? "accepted" : "dialed")
                    << "first=" << first_leg;
    if (first_leg) {
        emit chatConnected(ip);
    }

    if (active_peer_.isEmpty() && role == LinkRole::Accepted) {
        qCInfo(lcChat) << "auto-accepting chat from" << ip;
        setSession(ip, true);
        scheduleConnectBack(ip);
        return;
    }

    if (ip != active_peer_) {
        return;
    }

    setSession(ip, true);
    if (role == LinkRole::Accepted) {
        scheduleConnectBack(ip);
    }
}

void ChatConnectionManager::scheduleConnectBack(const QString& ip) {
    if (hub_->hasDialedLeg(ip) || hub_->isDialing(ip)) {
        return;
    }
    QTimer::singleShot(config_.reconnect_delay_ms, this, [this, ip]() {
        // The peer may have gone away or we may have dialed in the meantime.
        if (!hub_->isConnected(ip) || hub_->hasDialedLeg(ip)) {
            return;
        }
        auto dialed = hub_->dial(ip);
        if (dialed.is_err()) {
            qCWarning(lcChat).noquote() << "connect back failed:" << dialed.unwrap_err().qmessage();
        }
    });
}

void ChatConnectionManager::onPeerDisconnected(const QString& ip) {
    qCInfo(lcChat) << "chat disconnected" << ip;
    if (ip == active_peer_) {
        setSession(ip, false);
    }
    emit chatDisconnected(ip);
}

void ChatConnectionManager::onTextReceived(const QString& ip, const QString& text) {
    auto message = decode_chat_message(text);
    if (message.is_err()) {
        qCWarning(lcChat).noquote() << "dropping chat frame from" << ip << ":"
                                    << message.unwrap_err().qmessage();
        return;
    }
    emit chatMessageReceived(message.unwrap());
}

void ChatConnectionManager::onDialFailed(const QString& ip, const Error& error) {
    qCWarning(lcChat).noquote() << error.qmessage();
    emit chatConnectFailed(ip, error.qmessage());
}

} // namespace lanlink::network
