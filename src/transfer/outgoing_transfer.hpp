#pragma once

#include "network/transport.hpp"
#include "storage/storage_backend.hpp"
#include "transfer/transfer_session.hpp"

#include <QObject>
#include <QUrl>

#include <memory>
#include <optional>

class QTimer;
class QWebSocket;

namespace lanlink::core { class SyncState; }

namespace lanlink::transfer {

/**
 * OutgoingTransfer - streams one file to a peer over its own connection.
 *
 * Sends the metadata frame, then 256 KiB binary frames in order, then closes
 * normally. Reading stops while more than 4 MiB is handed to the socket but
 * not yet written; the backlog is re-checked every 50 ms. The send cancel
 * flag is checked per chunk and during every wait.
 *
 * The outcome is recorded in the TransferSession passed in; finished() fires
 * exactly once.
 */
class OutgoingTransfer : public QObject {
    Q_OBJECT

public:
    static constexpr qint64 kChunkSize = 256 * 1024;
    static constexpr qint64 kHighWaterMark = 4 * 1024 * 1024;
    static constexpr int kDrainPollMs = 50;
    static constexpr int kConnectTimeoutMs = 10000;

    OutgoingTransfer(storage::SourceInfo source,
                     TransferSession& session,
                     QUrl target,
                     storage::StorageBackend& storage,
                     std::shared_ptr<core::SyncState> state,
                     QObject* parent = nullptr);
    ~OutgoingTransfer() override;

    void start();

    [[nodiscard]] const TransferSession& session() const { return session_; }
    // Bytes handed to the socket that it has not written yet.
    [[nodiscard]] qint64 backlog() const { return backlog_.pending(); }

signals:
    void progress(const lanlink::transfer::TransferProgress& progress);
    void finished();

private slots:
    void onConnected();
    void onDisconnected();
    void onSocketError(QAbstractSocket::SocketError error);

private:
    void pump();
    void schedulePump(int delay_ms);
    void cancelLocally();
    void failWith(Error error);
    void finishNow();
    void releaseSource();

    storage::SourceInfo source_;
    TransferSession& session_;
    QUrl target_;
    storage::StorageBackend& storage_;
    std::shared_ptr<core::SyncState> state_;

    std::unique_ptr<QWebSocket> socket_;
    std::unique_ptr<QTimer> pump_timer_;
    std::unique_ptr<QTimer> connect_timer_;
    std::optional<storage::StreamHandle> handle_;
    network::SendBacklog backlog_;
    ProgressThrottle throttle_;

    quint64 offset_ = 0;
    bool connected_ = false;
    bool done_sending_ = false;
    bool finished_ = false;
};

} // namespace lanlink::transfer
