#include "network/peer_channel_hub.hpp"

#include "network/local_address.hpp"

#include <QHostAddress>
#include <QMutexLocker>
#include <QTimer>

#include <vector>

namespace lanlink::network {

std::optional<PeerLink> PeerChannelHub::Channel::writer() const {
    if (dialed && dialed->isOpen()) return dialed;
    if (accepted && accepted->isOpen()) return accepted;
    return std::nullopt;
}

bool PeerChannelHub::Channel::owns(const QWebSocket* socket) const {
    return (accepted && accepted->socket() == socket) || (dialed && dialed->socket() == socket);
}

PeerChannelHub::PeerChannelHub(HubConfig config, QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , server_(std::make_unique<WsServer>(QStringLiteral("lanlink-%1").arg(config_.name), this))
{
    connect(server_.get(), &WsServer::newConnection, this, &PeerChannelHub::onAccepted);
    connect(server_.get(), &WsServer::error, this, &PeerChannelHub::serverError);
}

PeerChannelHub::~PeerChannelHub() {
    server_->close();

    // Sockets are children of this object; make sure no handler runs while they go away.
    std::vector<QWebSocket*> sockets;
    {
        QMutexLocker lock(&mu_);
        for (auto& [ip, channel] : channels_) {
            if (channel.accepted && channel.accepted->socket()) sockets.push_back(channel.accepted->socket());
            if (channel.dialed && channel.dialed->socket()) sockets.push_back(channel.dialed->socket());
        }
        for (auto& [ip, socket] : pending_dials_) {
            if (socket) sockets.push_back(socket.data());
        }
        channels_.clear();
        pending_dials_.clear();
    }
    for (auto* socket : sockets) {
        QObject::disconnect(socket, nullptr, this, nullptr);
    }
}

Result<quint16, Error> PeerChannelHub::listen() {
    auto result = server_->listen(config_.listen_port);
    if (result.is_err()) {
        emit serverError(result.unwrap_err().qmessage());
    }
    return result;
}

void PeerChannelHub::stopListening() {
    server_->close();
}

bool PeerChannelHub::isListening() const {
    return server_->isListening();
}

quint16 PeerChannelHub::listenPort() const {
    return server_->port();
}

void PeerChannelHub::wireSocket(QWebSocket* socket, const QString& ip) {
    connect(socket, &QWebSocket::disconnected, socket, &QObject::deleteLater);
    connect(socket, &QWebSocket::textMessageReceived, this, [this, ip](const QString& text) {
        emit textReceived(ip, text);
    });
    connect(socket, &QWebSocket::disconnected, this, [this, ip, socket]() {
        onLinkClosed(ip, socket);
    });
}

void PeerChannelHub::onAccepted(QWebSocket* socket) {
    socket->setParent(this);
    const QString ip = normalize_peer_ip(socket->peerAddress(), config_.local_ip);
    wireSocket(socket, ip);
    attach(ip, PeerLink::accepted(socket));
}

Result<void, Error> PeerChannelHub::dial(const QString& ip, quint16 port) {
    QHostAddress address;
    if (ip.isEmpty() || !address.setAddress(ip)) {
        return Result<void, Error>::err(
            Error{ErrorKind::InvalidArgument, QStringLiteral("invalid peer address '%1'").arg(ip)});
    }

    {
        QMutexLocker lock(&mu_);
        if (auto it = pending_dials_.find(ip); it != pending_dials_.end() && it->second) {
            return Result<void, Error>::ok();
        }
        if (auto it = channels_.find(ip);
            it != channels_.end() && it->second.dialed && it->second.dialed->isOpen()) {
            return Result<void, Error>::ok();
        }
    }

    auto* socket = new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this);
    {
        QMutexLocker lock(&mu_);
        pending_dials_[ip] = socket;
    }

    connect(socket, &QWebSocket::connected, this, [this, ip, socket]() {
        {
            QMutexLocker lock(&mu_);
            auto it = pending_dials_.find(ip);
            if (it == pending_dials_.end() || it->second != socket) {
                return;
            }
            pending_dials_.erase(it);
        }
        QObject::disconnect(socket, &QWebSocket::errorOccurred, this, nullptr);
        wireSocket(socket, ip);
        attach(ip, PeerLink::dialed(socket));
    });
    connect(socket, &QWebSocket::errorOccurred, this,
            [this, ip, socket](QAbstractSocket::SocketError error) {
        finishDial(ip, socket,
                   Error{classify_socket_error(error),
                         QStringLiteral("cannot reach %1: %2").arg(ip, socket->errorString())});
    });
    QTimer::singleShot(config_.dial_timeout_ms, socket, [this, ip, socket]() {
        finishDial(ip, socket,
                   Error{ErrorKind::Timeout, QStringLiteral("connecting to %1 timed out").arg(ip)});
    });

    socket->open(ws_url(ip, port != 0 ? port : config_.peer_port));
    return Result<void, Error>::ok();
}

void PeerChannelHub::finishDial(const QString& ip, QWebSocket* socket, const Error& error) {
    {
        QMutexLocker lock(&mu_);
        auto it = pending_dials_.find(ip);
        if (it == pending_dials_.end() || it->second != socket) {
            return;
        }
        pending_dials_.erase(it);
    }
    QObject::disconnect(socket, nullptr, this, nullptr);
    socket->abort();
    socket->deleteLater();
    emit dialFailed(ip, error);
}

void PeerChannelHub::attach(const QString& ip, PeerLink link) {
    bool first_leg = false;
    QWebSocket* replaced = nullptr;
    {
        QMutexLocker lock(&mu_);
        auto [it, inserted] = channels_.try_emplace(ip);
        first_leg = inserted;
        auto& slot = link.role() == LinkRole::Accepted ? it->second.accepted : it->second.dialed;
        if (slot && slot->socket() && slot->socket() != link.socket()) {
            replaced = slot->socket();
        }
        slot = link;
    }
    if (replaced) {
        retire(replaced);
    }
    emit peerConnected(ip, link.role(), first_leg);
}

void PeerChannelHub::retire(QWebSocket* socket) {
    QObject::disconnect(socket, nullptr, this, nullptr);
    socket->close(QWebSocketProtocol::CloseCodeNormal, QStringLiteral("replaced"));
}

void PeerChannelHub::onLinkClosed(const QString& ip, QWebSocket* socket) {
    std::optional<PeerLink> other;
    {
        QMutexLocker lock(&mu_);
        auto it = channels_.find(ip);
        if (it == channels_.end() || !it->second.owns(socket)) {
            return;
        }
        const auto& channel = it->second;
        if (channel.accepted && channel.accepted->socket() != socket) other = channel.accepted;
        if (channel.dialed && channel.dialed->socket() != socket) other = channel.dialed;
        channels_.erase(it);
    }
    if (other) {
        other->close();
    }
    emit peerDisconnected(ip);
}

Result<void, Error> PeerChannelHub::sendText(const QString& ip, const QString& text) {
    std::optional<PeerLink> writer;
    {
        QMutexLocker lock(&mu_);
        if (auto it = channels_.find(ip); it != channels_.end()) {
            writer = it->second.writer();
        }
    }
    if (!writer) {
        return Result<void, Error>::err(
            Error{ErrorKind::NotConnected, QStringLiteral("Not connected to %1").arg(ip)});
    }

    auto sent = writer->sendText(text);
    if (sent.is_err()) {
        closePeer(ip);
        return Result<void, Error>::err(
            Error{ErrorKind::NotConnected,
                  QStringLiteral("Not connected to %1: %2").arg(ip, sent.unwrap_err().qmessage())});
    }
    return Result<void, Error>::ok();
}

QStringList PeerChannelHub::broadcastText(const QString& text) {
    std::vector<std::pair<QString, PeerLink>> targets;
    {
        QMutexLocker lock(&mu_);
        targets.reserve(channels_.size());
        for (const auto& [ip, channel] : channels_) {
            if (auto writer = channel.writer()) {
                targets.emplace_back(ip, *writer);
            }
        }
    }

    QStringList delivered;
    QStringList dead;
    for (const auto& [ip, writer] : targets) {
        if (writer.sendText(text).is_ok()) {
            delivered.append(ip);
        } else {
            dead.append(ip);
        }
    }
    for (const auto& ip : dead) {
        closePeer(ip);
    }
    return delivered;
}

void PeerChannelHub::closePeer(const QString& ip) {
    std::optional<Channel> channel;
    {
        QMutexLocker lock(&mu_);
        auto it = channels_.find(ip);
        if (it == channels_.end()) {
            return;
        }
        channel = it->second;
        channels_.erase(it);
    }
    if (channel->accepted) channel->accepted->close();
    if (channel->dialed) channel->dialed->close();
    emit peerDisconnected(ip);
}

void PeerChannelHub::closeAll() {
    for (const auto& ip : peers()) {
        closePeer(ip);
    }
}

bool PeerChannelHub::isConnected(const QString& ip) const {
    QMutexLocker lock(&mu_);
    auto it = channels_.find(ip);
    return it != channels_.end() && it->second.writer().has_value();
}

bool PeerChannelHub::hasDialedLeg(const QString& ip) const {
    QMutexLocker lock(&mu_);
    auto it = channels_.find(ip);
    return it != channels_.end() && it->second.dialed && it->second.dialed->isOpen();
}

bool PeerChannelHub::isDialing(const QString& ip) const {
    QMutexLocker lock(&mu_);
    auto it = pending_dials_.find(ip);
    return it != pending_dials_.end() && it->second;
}

QStringList PeerChannelHub::peers() const {
    QMutexLocker lock(&mu_);
    QStringList ips;
    for (const auto& [ip, channel] : channels_) {
        ips.append(ip);
    }
    return ips;
}

} // namespace lanlink::network
