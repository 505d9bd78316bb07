#include "transfer/incoming_transfer.hpp"

#include "core/log.hpp"
#include "core/sync_state.hpp"
#include "network/transport.hpp"

#include <QWebSocket>

namespace lanlink::transfer {

IncomingTransfer::IncomingTransfer(QWebSocket* socket,
                                   QString save_dir,
                                   storage::StorageBackend& storage,
                                   std::shared_ptr<core::SyncState> state,
                                   QObject* parent)
    : QObject(parent)
    , socket_(socket)
    , peer_ip_(socket->peerAddress().toString())
    , save_dir_(std::move(save_dir))
    , storage_(storage)
    , state_(std::move(state))
    , cancel_generation_(state_->receiveCancelGeneration())
{
    socket_->setParent(this);

    // A peer's close frame starts the handshake while the socket is still connected;
    // the TCP layer's own aboutToClose on a dropped link comes after that state is gone.
    connect(socket_, &QWebSocket::aboutToClose, this, [this]() {
        if (socket_->state() == QAbstractSocket::ConnectedState) {
            close_frame_seen_ = true;
        }
    });
    connect(socket_, &QWebSocket::textMessageReceived, this, &IncomingTransfer::onTextMessage);
    connect(socket_, &QWebSocket::binaryMessageReceived, this, &IncomingTransfer::onBinaryMessage);
    connect(socket_, &QWebSocket::disconnected, this, &IncomingTransfer::onDisconnected);
}

IncomingTransfer::~IncomingTransfer() {
    QObject::disconnect(socket_, nullptr, this, nullptr);
    // Torn down mid-transfer (receiver stopped): never leave a partial file behind.
    if (session_ && !is_terminal(session_->state())) {
        session_->cancel(ErrorKind::CancelledByLocal);
        discardPartial();
    }
}

void IncomingTransfer::onTextMessage(const QString& text) {
    if (session_) {
        qCWarning(lcTransfer) << "ignoring extra metadata from" << peer_ip_;
        return;
    }

    auto decoded = decode_file_meta(text.toUtf8());
    if (decoded.is_err()) {
        qCWarning(lcTransfer).noquote() << "bad metadata from" << peer_ip_ << ":"
                                        << decoded.unwrap_err().qmessage();
        return;
    }

    const auto meta = decoded.unwrap();
    const QString name = meta.destinationName();
    session_.emplace(TransferDirection::Receive, name, meta.size, meta.index, meta.total);
    throttle_.emplace(meta.size);
    session_->begin();

    auto target = storage_.open_write_stream(save_dir_, name);
    if (target.is_err()) {
        abortWith(target.unwrap_err());
        return;
    }
    target_ = target.unwrap();

    qCInfo(lcTransfer) << "receiving" << name << "from" << peer_ip_
                       << "size=" << (meta.size ? QString::number(*meta.size) : QStringLiteral("?"))
                       << "into" << save_dir_;
    emit receivingStarted(name, meta.index, meta.total);
}

void IncomingTransfer::onBinaryMessage(const QByteArray& data) {
    if (!session_ || !target_) {
        qCWarning(lcTransfer) << "dropping" << data.size() << "bytes without metadata from" << peer_ip_;
        return;
    }
    if (session_->state() != TransferState::InProgress) {
        return;
    }

    if (state_->receiveCancelledSince(cancel_generation_)) {
        cancelByOperator();
        return;
    }

    auto written = storage_.write(target_->handle, data);
    if (written.is_err()) {
        abortWith(written.unwrap_err());
        return;
    }

    session_->addBytes(static_cast<quint64>(data.size()));
    if (throttle_->shouldEmit(session_->bytesTransferred())) {
        emit progress(session_->progress());
    }
}

void IncomingTransfer::cancelByOperator() {
    qCInfo(lcTransfer) << "receive of" << session_->fileName() << "cancelled";
    session_->cancel(ErrorKind::CancelledByLocal);
    socket_->close(static_cast<QWebSocketProtocol::CloseCode>(network::kCloseCancelledByReceiver),
                   QString::fromLatin1(network::kCancelledByReceiverReason));
    discardPartial();
    emit receiveCancelled(session_->fileName(), ErrorKind::CancelledByLocal);
}

void IncomingTransfer::abortWith(Error error) {
    qCWarning(lcTransfer).noquote() << "receive of" << session_->fileName() << "failed:" << error.qmessage();
    session_->fail(error);
    socket_->close(QWebSocketProtocol::CloseCodeBadOperation, QStringLiteral("Storage failure"));
    discardPartial();
    emit receiveFailed(session_->fileName(), error);
}

void IncomingTransfer::discardPartial() {
    if (!target_) return;
    auto removed = storage_.remove(target_->handle);
    if (removed.is_err()) {
        qCWarning(lcTransfer).noquote() << "cannot delete partial file" << target_->location << ":"
                                        << removed.unwrap_err().qmessage();
    }
    target_.reset();
}

void IncomingTransfer::completeReceive() {
    const auto handle = target_->handle;
    auto closed = storage_.close(handle);
    if (closed.is_err()) {
        abortWith(closed.unwrap_err());
        return;
    }
    storage_.release(handle);
    session_->complete();
    const QString location = target_->location;
    target_.reset();
    qCInfo(lcTransfer) << "received" << session_->fileName() << session_->bytesTransferred() << "bytes";
    emit received(session_->fileName(), session_->bytesTransferred(), location);
}

void IncomingTransfer::onDisconnected() {
    if (!session_ || session_->state() != TransferState::InProgress) {
        emit finished();
        return;
    }

    const auto code = socket_->closeCode();
    if (state_->receiveCancelledSince(cancel_generation_)) {
        cancelByOperator();
    } else if (!close_frame_seen_) {
        // Reset or abort: no close handshake, so even a legacy sender's bytes are suspect.
        const Error error{ErrorKind::PeerUnreachable,
                          QStringLiteral("connection from %1 lost after %2 bytes")
                              .arg(peer_ip_)
                              .arg(session_->bytesTransferred())};
        qCWarning(lcTransfer).noquote() << "receive of" << session_->fileName() << "failed:" << error.qmessage();
        session_->fail(error);
        discardPartial();
        emit receiveFailed(session_->fileName(), error);
    } else if (code == QWebSocketProtocol::CloseCodeNormal && session_->isByteCountComplete()) {
        completeReceive();
    } else {
        qCInfo(lcTransfer) << "incomplete transfer of" << session_->fileName() << ":"
                           << session_->bytesTransferred() << "of"
                           << session_->totalBytes().value_or(0) << "bytes, close code" << code;
        session_->cancel(ErrorKind::CancelledByRemote);
        discardPartial();
        emit receiveCancelled(session_->fileName(), ErrorKind::CancelledByRemote);
    }
    emit finished();
}

} // namespace lanlink::transfer
