#include "transfer/outgoing_transfer.hpp"

#include "core/log.hpp"
#include "core/sync_state.hpp"
#include "transfer/file_meta.hpp"

#include <QTimer>
#include <QWebSocket>

#include <algorithm>

namespace lanlink::transfer {

OutgoingTransfer::OutgoingTransfer(storage::SourceInfo source,
                                   TransferSession& session,
                                   QUrl target,
                                   storage::StorageBackend& storage,
                                   std::shared_ptr<core::SyncState> state,
                                   QObject* parent)
    : QObject(parent)
    , source_(std::move(source))
    , session_(session)
    , target_(std::move(target))
    , storage_(storage)
    , state_(std::move(state))
    , socket_(std::make_unique<QWebSocket>(QString(), QWebSocketProtocol::VersionLatest))
    , pump_timer_(std::make_unique<QTimer>(this))
    , connect_timer_(std::make_unique<QTimer>(this))
    , throttle_(source_.size)
{
    pump_timer_->setSingleShot(true);
    connect_timer_->setSingleShot(true);
    connect_timer_->setInterval(kConnectTimeoutMs);

    connect(pump_timer_.get(), &QTimer::timeout, this, &OutgoingTransfer::pump);
    connect(connect_timer_.get(), &QTimer::timeout, this, [this]() {
        if (!connected_) {
            failWith(Error{ErrorKind::Timeout,
                           QStringLiteral("connecting to %1 timed out").arg(target_.host())});
        }
    });

    connect(socket_.get(), &QWebSocket::connected, this, &OutgoingTransfer::onConnected);
    connect(socket_.get(), &QWebSocket::disconnected, this, &OutgoingTransfer::onDisconnected);
    connect(socket_.get(), &QWebSocket::errorOccurred, this, &OutgoingTransfer::onSocketError);
    connect(socket_.get(), &QWebSocket::bytesWritten, this, [this](qint64 bytes) {
        backlog_.written(bytes);
    });
}

OutgoingTransfer::~OutgoingTransfer() {
    if (socket_) {
        QObject::disconnect(socket_.get(), nullptr, this, nullptr);
        socket_->abort();
    }
    releaseSource();
}

void OutgoingTransfer::start() {
    if (!session_.begin()) {
        qCWarning(lcTransfer) << "session for" << source_.name << "already started";
        return;
    }

    auto handle = storage_.open_read_stream(source_.location);
    if (handle.is_err()) {
        // Report after returning so the caller never sees finished() re-entrantly.
        const auto error = handle.unwrap_err();
        QTimer::singleShot(0, this, [this, error]() { failWith(error); });
        return;
    }
    handle_ = handle.unwrap();

    qCInfo(lcTransfer) << "sending" << session_.fileName() << "to" << target_.toString()
                       << "size=" << source_.size;
    connect_timer_->start();
    socket_->open(target_);
}

void OutgoingTransfer::onConnected() {
    connected_ = true;
    connect_timer_->stop();

    FileMeta meta;
    meta.name = source_.name;
    meta.size = source_.size;
    meta.index = session_.sequenceIndex();
    meta.total = session_.sequenceTotal();
    meta.relative_path = source_.relative_path;

    const QString text = QString::fromUtf8(encode_file_meta(meta));
    socket_->sendTextMessage(text);
    backlog_.queued(text.toUtf8().size());

    pump();
}

void OutgoingTransfer::schedulePump(int delay_ms) {
    if (!pump_timer_->isActive()) {
        pump_timer_->start(delay_ms);
    }
}

void OutgoingTransfer::pump() {
    if (finished_ || done_sending_ || !connected_) return;
    if (socket_->state() != QAbstractSocket::ConnectedState) return;

    while (true) {
        if (finished_ || socket_->state() != QAbstractSocket::ConnectedState) {
            return;
        }
        if (state_->sendCancelRequested()) {
            cancelLocally();
            return;
        }

        if (backlog_.pending() >= kHighWaterMark) {
            schedulePump(kDrainPollMs);
            return;
        }

        const quint64 remaining = source_.size - std::min(offset_, source_.size);
        if (remaining == 0) {
            done_sending_ = true;
            releaseSource();
            qCDebug(lcTransfer) << "all bytes queued for" << session_.fileName();
            socket_->close(QWebSocketProtocol::CloseCodeNormal);
            return;
        }

        const qint64 want = std::min<qint64>(kChunkSize, static_cast<qint64>(remaining));
        auto chunk = storage_.read_chunk(*handle_, static_cast<qint64>(offset_), want);
        if (chunk.is_err()) {
            failWith(chunk.unwrap_err());
            return;
        }

        const QByteArray& bytes = chunk.unwrap();
        if (bytes.isEmpty()) {
            failWith(Error{ErrorKind::StorageReadFailure,
                           QStringLiteral("%1 ended early at %2 bytes").arg(source_.name).arg(offset_)});
            return;
        }

        socket_->sendBinaryMessage(bytes);
        backlog_.queued(bytes.size());
        offset_ += static_cast<quint64>(bytes.size());
        session_.addBytes(static_cast<quint64>(bytes.size()));

        if (throttle_.shouldEmit(session_.bytesTransferred())) {
            emit progress(session_.progress());
        }
    }
}

void OutgoingTransfer::onDisconnected() {
    if (finished_ || is_terminal(session_.state())) return;

    if (!connected_) {
        failWith(Error{ErrorKind::PeerUnreachable,
                       QStringLiteral("cannot reach %1: %2").arg(target_.host(), socket_->errorString())});
        return;
    }

    const auto code = static_cast<int>(socket_->closeCode());
    if (code == network::kCloseCancelledByReceiver) {
        qCInfo(lcTransfer) << session_.fileName() << "cancelled by receiver";
        session_.cancel(ErrorKind::CancelledByRemote);
        finishNow();
        return;
    }

    if (done_sending_) {
        session_.complete();
        qCInfo(lcTransfer) << "sent" << session_.fileName() << session_.bytesTransferred() << "bytes";
        finishNow();
        return;
    }

    failWith(Error{ErrorKind::PeerUnreachable,
                   QStringLiteral("connection to %1 lost after %2 bytes")
                       .arg(target_.host())
                       .arg(session_.bytesTransferred()),
                   code});
}

void OutgoingTransfer::onSocketError(QAbstractSocket::SocketError error) {
    // Once connected, disconnected() carries the outcome.
    if (finished_ || connected_ || is_terminal(session_.state())) return;
    failWith(Error{network::classify_socket_error(error),
                   QStringLiteral("cannot reach %1: %2").arg(target_.host(), socket_->errorString())});
}

void OutgoingTransfer::cancelLocally() {
    qCInfo(lcTransfer) << "send of" << session_.fileName() << "cancelled";
    session_.cancel(ErrorKind::CancelledByLocal);
    socket_->close(QWebSocketProtocol::CloseCodeGoingAway, QStringLiteral("Cancelled by sender"));
    finishNow();
}

void OutgoingTransfer::failWith(Error error) {
    if (finished_) return;
    qCWarning(lcTransfer).noquote() << "send of" << session_.fileName() << "failed:" << error.qmessage();
    session_.fail(std::move(error));
    if (socket_->state() != QAbstractSocket::UnconnectedState) {
        socket_->abort();
    }
    finishNow();
}

void OutgoingTransfer::finishNow() {
    if (finished_) return;
    finished_ = true;
    pump_timer_->stop();
    connect_timer_->stop();
    releaseSource();
    emit finished();
}

void OutgoingTransfer::releaseSource() {
    if (!handle_) return;
    auto closed = storage_.close(*handle_);
    if (closed.is_err()) {
        qCWarning(lcTransfer).noquote() << "closing source failed:" << closed.unwrap_err().qmessage();
    }
    handle_.reset();
}

} // namespace lanlink::transfer
