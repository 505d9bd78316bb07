#pragma once

#include "storage/storage_backend.hpp"
#include "transfer/file_meta.hpp"
#include "transfer/transfer_session.hpp"

#include <QObject>

#include <memory>
#include <optional>

class QWebSocket;

namespace lanlink::core { class SyncState; }

namespace lanlink::transfer {

/**
 * IncomingTransfer - receives one file on one accepted connection.
 *
 * The first text frame carries the metadata; binary frames are appended in
 * order. The file is kept only when the sender closes normally and the byte
 * count matches the announced size (or the sender never announced one).
 * Any other close code means the sender gave up; a connection lost without a
 * close frame is a failure. Both delete the partial file.
 *
 * The receive cancel generation is recorded at accept time and checked per
 * binary frame; a newer one closes the connection with code 4001 and deletes
 * the partial file at once.
 */
class IncomingTransfer : public QObject {
    Q_OBJECT

public:
    IncomingTransfer(QWebSocket* socket,
                     QString save_dir,
                     storage::StorageBackend& storage,
                     std::shared_ptr<core::SyncState> state,
                     QObject* parent = nullptr);
    ~IncomingTransfer() override;

    [[nodiscard]] const QString& saveDir() const { return save_dir_; }
    [[nodiscard]] const std::optional<TransferSession>& session() const { return session_; }

signals:
    void receivingStarted(const QString& file_name, quint32 index, quint32 total);
    void progress(const lanlink::transfer::TransferProgress& progress);
    void received(const QString& file_name, quint64 bytes, const QString& location);
    void receiveCancelled(const QString& file_name, lanlink::ErrorKind reason);
    void receiveFailed(const QString& file_name, const lanlink::Error& error);
    void finished();

private slots:
    void onTextMessage(const QString& text);
    void onBinaryMessage(const QByteArray& data);
    void onDisconnected();

private:
    void completeReceive();
    void cancelByOperator();
    void abortWith(Error error);
    void discardPartial();

    QWebSocket* socket_;
    QString peer_ip_;
    QString save_dir_;
    storage::StorageBackend& storage_;
    std::shared_ptr<core::SyncState> state_;
    const uint64_t cancel_generation_;
    bool close_frame_seen_ = false;

    std::optional<TransferSession> session_;
    std::optional<ProgressThrottle> throttle_;
    std::optional<storage::WriteTarget> target_;
};

} // namespace lanlink::transfer
