#pragma once

#include "core/result.hpp"

#include <QObject>
#include <QPointer>
#include <QUrl>
#include <QWebSocket>
#include <QWebSocketProtocol>

#include <memory>
#include <variant>

class QWebSocketServer;

namespace lanlink::network {

constexpr quint16 kDefaultTransferPort = 7878;
constexpr quint16 kDefaultChatPort = 7879;
constexpr quint16 kDefaultClipboardPort = 7880;

/**
 * Application close code a receiver sends when the operator cancels.
 */
constexpr quint16 kCloseCancelledByReceiver = 4001;
inline constexpr const char* kCancelledByReceiverReason = "Cancelled by receiver";

QUrl ws_url(const QString& host, quint16 port);

/**
 * Map a socket error seen while dialing to an ErrorKind.
 */
ErrorKind classify_socket_error(QAbstractSocket::SocketError error);

/**
 * WsServer - Listens for incoming WebSocket connections.
 */
class WsServer : public QObject {
    Q_OBJECT

public:
    explicit WsServer(const QString& name, QObject* parent = nullptr);
    ~WsServer() override;

    /**
     * Start listening on all IPv4 interfaces.
     * @param port Port to listen on (0 for auto-assign)
     * @return The actual port being listened on
     */
    Result<quint16, Error> listen(quint16 port);

    void close();

    [[nodiscard]] quint16 port() const;
    [[nodiscard]] bool isListening() const;

signals:
    /**
     * Emitted for each accepted connection. The receiver takes ownership.
     */
    void newConnection(QWebSocket* socket);
    void error(const QString& message);

private slots:
    void onNewConnection();
    void onAcceptError(QAbstractSocket::SocketError socket_error);

private:
    QString name_;
    std::unique_ptr<QWebSocketServer> server_;
};

/**
 * Which side opened a connection.
 */
enum class LinkRole {
    Accepted,
    Dialed
};

/**
 * PeerLink - one live WebSocket leg to a peer.
 *
 * The leg is either the server-role half produced by an acceptor or the
 * client-role half produced by a connector. Both expose the same send/close
 * surface so a writer can be chosen without caring which side opened it.
 */
class PeerLink {
public:
    struct Accepted { QPointer<QWebSocket> socket; };
    struct Dialed { QPointer<QWebSocket> socket; };

    static PeerLink accepted(QWebSocket* socket) { return PeerLink(Accepted{socket}); }
    static PeerLink dialed(QWebSocket* socket) { return PeerLink(Dialed{socket}); }

    [[nodiscard]] LinkRole role() const;
    [[nodiscard]] QWebSocket* socket() const;
    [[nodiscard]] bool isOpen() const;

    Result<void, Error> sendText(const QString& text) const;
    void close(QWebSocketProtocol::CloseCode code = QWebSocketProtocol::CloseCodeNormal,
               const QString& reason = QString()) const;

private:
    using Stream = std::variant<Accepted, Dialed>;
    explicit PeerLink(Stream stream) : stream_(std::move(stream)) {}

    Stream stream_;
};

/**
 * SendBacklog - bytes handed to a socket but not yet written to the OS.
 */
class SendBacklog {
public:
    void queued(qint64 bytes) { pending_ += bytes; }

    void written(qint64 bytes) {
        pending_ -= bytes;
        // Frame headers and the handshake count as written but were never queued.
        if (pending_ < 0) pending_ = 0;
    }

    [[nodiscard]] qint64 pending() const { return pending_; }

private:
    qint64 pending_ = 0;
};

} // namespace lanlink::network
