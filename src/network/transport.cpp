#include "network/transport.hpp"

#include <QHostAddress>
#include <QWebSocketServer>

namespace lanlink::network {

QUrl ws_url(const QString& host, quint16 port) {
    QUrl url;
    url.setScheme(QStringLiteral("ws"));
    url.setHost(host);
    url.setPort(port);
    return url;
}

ErrorKind classify_socket_error(QAbstractSocket::SocketError error) {
    switch (error) {
        case QAbstractSocket::ConnectionRefusedError:
            return ErrorKind::ConnectionRefused;
        case QAbstractSocket::SocketTimeoutError:
            return ErrorKind::Timeout;
        default:
            return ErrorKind::PeerUnreachable;
    }
}

// WsServer

WsServer::WsServer(const QString& name, QObject* parent)
    : QObject(parent)
    , name_(name)
    , server_(std::make_unique<QWebSocketServer>(name, QWebSocketServer::NonSecureMode))
{
    connect(server_.get(), &QWebSocketServer::newConnection,
            this, &WsServer::onNewConnection);
    connect(server_.get(), &QWebSocketServer::acceptError,
            this, &WsServer::onAcceptError);
}

WsServer::~WsServer() {
    close();
}

Result<quint16, Error> WsServer::listen(quint16 port) {
    if (server_->isListening()) {
        return Result<quint16, Error>::ok(server_->serverPort());
    }

    if (!server_->listen(QHostAddress::AnyIPv4, port)) {
        return Result<quint16, Error>::err(
            Error{ErrorKind::NetworkBindFailure,
                  QStringLiteral("%1: listen on port %2 failed: %3")
                      .arg(name_)
                      .arg(port)
                      .arg(server_->errorString())});
    }
    return Result<quint16, Error>::ok(server_->serverPort());
}

void WsServer::close() {
    if (server_) {
        server_->close();
    }
}

quint16 WsServer::port() const {
    return server_->serverPort();
}

bool WsServer::isListening() const {
    return server_->isListening();
}

void WsServer::onNewConnection() {
    while (server_->hasPendingConnections()) {
        QWebSocket* socket = server_->nextPendingConnection();
        if (socket) {
            emit newConnection(socket);
        }
    }
}

void WsServer::onAcceptError(QAbstractSocket::SocketError socket_error) {
    Q_UNUSED(socket_error)
    emit error(QStringLiteral("%1: accept failed: %2").arg(name_, server_->errorString()));
}

// PeerLink

LinkRole PeerLink::role() const {
    return std::holds_alternative<Accepted>(stream_) ? LinkRole::Accepted : LinkRole::Dialed;
}

QWebSocket* PeerLink::socket() const {
    return std::visit([](const auto& leg) -> QWebSocket* { return leg.socket.data(); }, stream_);
}

bool PeerLink::isOpen() const {
    auto* s = socket();
    return s && s->state() == QAbstractSocket::ConnectedState;
}

Result<void, Error> PeerLink::sendText(const QString& text) const {
    if (!isOpen()) {
        return Result<void, Error>::err(Error{ErrorKind::NotConnected, "link is closed"});
    }
    const qint64 sent = socket()->sendTextMessage(text);
    if (!text.isEmpty() && sent <= 0) {
        return Result<void, Error>::err(
            Error{ErrorKind::NotConnected,
                  QStringLiteral("send failed: %1").arg(socket()->errorString())});
    }
    return Result<void, Error>::ok();
}

void PeerLink::close(QWebSocketProtocol::CloseCode code, const QString& reason) const {
    if (auto* s = socket()) {
        s->close(code, reason);
    }
}

} // namespace lanlink::network
