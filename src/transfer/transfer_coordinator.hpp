#pragma once

#include "core/result.hpp"
#include "network/transport.hpp"
#include "storage/storage_backend.hpp"
#include "transfer/transfer_session.hpp"

#include <QObject>
#include <QPointer>
#include <QStringList>

#include <memory>
#include <vector>

namespace lanlink::core { class SyncState; }

namespace lanlink::transfer {

class IncomingTransfer;
class OutgoingTransfer;

struct TransferConfig {
    quint16 listen_port = network::kDefaultTransferPort;
    quint16 peer_port = network::kDefaultTransferPort;
};

/**
 * Final result of one send request (one or more files).
 */
struct SendOutcome {
    QString peer_ip;
    TransferState state = TransferState::Completed;
    ErrorKind reason = ErrorKind::Unknown;
    QString message;
    QString file_name;
    int files_sent = 0;
    int files_total = 0;
};

/**
 * TransferCoordinator - serial multi-file sending and the receive listener.
 *
 * Sending: files go one connection each, strictly in order. Any outcome
 * other than Completed aborts the rest of the queue. The send cancel flag is
 * checked before each file and by the running OutgoingTransfer.
 *
 * Receiving: every accepted connection reads the save directory from
 * SyncState at accept time, so changing it affects the next connection only.
 */
class TransferCoordinator : public QObject {
    Q_OBJECT

public:
    TransferCoordinator(TransferConfig config,
                        std::shared_ptr<core::SyncState> state,
                        std::shared_ptr<storage::StorageBackend> storage,
                        QObject* parent = nullptr);
    ~TransferCoordinator() override;

    /**
     * Start the receive listener and set the save directory. When already
     * listening only the save directory changes.
     */
    Result<quint16, Error> startReceiver(const QString& save_dir);
    void stopReceiver();
    [[nodiscard]] bool isReceiving() const;
    [[nodiscard]] quint16 receiverPort() const;

    Result<void, Error> sendFiles(const QString& ip, const QStringList& paths);
    Result<void, Error> sendFolder(const QString& ip, const QString& dir);

    void cancelSending();
    void cancelReceiving();

    [[nodiscard]] bool isSending() const { return sending_; }
    [[nodiscard]] const TransferQueue& queue() const { return queue_; }

signals:
    void fileSending(const QString& file_name, quint32 index, quint32 total);
    void sendProgress(const lanlink::transfer::TransferProgress& progress);
    void fileSent(const QString& file_name);
    void sendFinished(const lanlink::transfer::SendOutcome& outcome);

    void fileReceivingStarted(const QString& file_name, quint32 index, quint32 total);
    void receiveProgress(const lanlink::transfer::TransferProgress& progress);
    void fileReceived(const QString& file_name, quint64 bytes, const QString& location);
    void fileReceiveCancelled(const QString& file_name, lanlink::ErrorKind reason);
    void fileReceiveFailed(const QString& file_name, const QString& message);
    void receiverError(const QString& message);

private slots:
    void onIncomingConnection(QWebSocket* socket);

private:
    Result<void, Error> beginSend(const QString& ip, std::vector<storage::SourceInfo> sources);
    void advance();
    void onOutgoingFinished();
    void finishSend(TransferState state, ErrorKind reason, const QString& message, const QString& file);

    TransferConfig config_;
    std::shared_ptr<core::SyncState> state_;
    std::shared_ptr<storage::StorageBackend> storage_;
    std::unique_ptr<network::WsServer> server_;

    QString peer_ip_;
    std::vector<storage::SourceInfo> sources_;
    TransferQueue queue_;
    QPointer<OutgoingTransfer> current_;
    bool sending_ = false;

    std::vector<QPointer<IncomingTransfer>> incoming_;
};

} // namespace lanlink::transfer

Q_DECLARE_METATYPE(lanlink::transfer::SendOutcome)
