#include "transfer/transfer_coordinator.hpp"

#include "core/log.hpp"
#include "core/sync_state.hpp"
#include "transfer/incoming_transfer.hpp"
#include "transfer/outgoing_transfer.hpp"

#include <QHostAddress>

#include <algorithm>

namespace lanlink::transfer {

TransferCoordinator::TransferCoordinator(TransferConfig config,
                                         std::shared_ptr<core::SyncState> state,
                                         std::shared_ptr<storage::StorageBackend> storage,
                                         QObject* parent)
    : QObject(parent)
    , config_(config)
    , state_(std::move(state))
    , storage_(std::move(storage))
    , server_(std::make_unique<network::WsServer>(QStringLiteral("lanlink-transfer"), this))
{
    connect(server_.get(), &network::WsServer::newConnection,
            this, &TransferCoordinator::onIncomingConnection);
    connect(server_.get(), &network::WsServer::error,
            this, &TransferCoordinator::receiverError);
}

TransferCoordinator::~TransferCoordinator() {
    // Transfers release storage handles on destruction; storage_ must still be alive.
    if (current_) {
        QObject::disconnect(current_.data(), nullptr, this, nullptr);
        delete current_.data();
    }
    for (auto& incoming : incoming_) {
        if (incoming) {
            QObject::disconnect(incoming.data(), nullptr, this, nullptr);
            delete incoming.data();
        }
    }
}

Result<quint16, Error> TransferCoordinator::startReceiver(const QString& save_dir) {
    state_->setSaveDir(save_dir);
    if (server_->isListening()) {
        qCInfo(lcTransfer) << "save directory changed to" << save_dir;
        return Result<quint16, Error>::ok(server_->port());
    }

    auto result = server_->listen(config_.listen_port);
    if (result.is_err()) {
        qCWarning(lcTransfer).noquote() << result.unwrap_err().qmessage();
        emit receiverError(result.unwrap_err().qmessage());
        return result;
    }
    qCInfo(lcTransfer) << "receiver listening on port" << result.unwrap() << "saving to" << save_dir;
    return result;
}

void TransferCoordinator::stopReceiver() {
    server_->close();
}

bool TransferCoordinator::isReceiving() const {
    return server_->isListening();
}

quint16 TransferCoordinator::receiverPort() const {
    return server_->port();
}

void TransferCoordinator::onIncomingConnection(QWebSocket* socket) {
    const QString save_dir = state_->saveDir();
    auto* incoming = new IncomingTransfer(socket, save_dir, *storage_, state_, this);

    connect(incoming, &IncomingTransfer::receivingStarted,
            this, &TransferCoordinator::fileReceivingStarted);
    connect(incoming, &IncomingTransfer::progress,
            this, &TransferCoordinator::receiveProgress);
    connect(incoming, &IncomingTransfer::received,
            this, &TransferCoordinator::fileReceived);
    connect(incoming, &IncomingTransfer::receiveCancelled,
            this, &TransferCoordinator::fileReceiveCancelled);
    connect(incoming, &IncomingTransfer::receiveFailed, this,
            [this](const QString& name, const Error& error) {
        emit fileReceiveFailed(name, error.qmessage());
    });
    connect(incoming, &IncomingTransfer::finished, this, [this, incoming]() {
        incoming_.erase(std::remove_if(incoming_.begin(), incoming_.end(),
                                       [incoming](const QPointer<IncomingTransfer>& p) {
                                           return p.isNull() || p.data() == incoming;
                                       }),
                        incoming_.end());
        incoming->deleteLater();
    });

    incoming_.emplace_back(incoming);
}

Result<void, Error> TransferCoordinator::sendFiles(const QString& ip, const QStringList& paths) {
    if (paths.isEmpty()) {
        return Result<void, Error>::err(Error{ErrorKind::InvalidArgument, "no files to send"});
    }

    std::vector<storage::SourceInfo> sources;
    sources.reserve(static_cast<size_t>(paths.size()));
    for (const auto& path : paths) {
        auto info = storage_->describe(path);
        if (info.is_err()) {
            return Result<void, Error>::err(info.unwrap_err());
        }
        sources.push_back(info.unwrap());
    }
    return beginSend(ip, std::move(sources));
}

Result<void, Error> TransferCoordinator::sendFolder(const QString& ip, const QString& dir) {
    auto listing = storage_->list_folder(dir);
    if (listing.is_err()) {
        return Result<void, Error>::err(listing.unwrap_err());
    }
    if (listing.unwrap().empty()) {
        return Result<void, Error>::err(
            Error{ErrorKind::InvalidArgument, QStringLiteral("folder %1 has no files").arg(dir)});
    }
    return beginSend(ip, listing.unwrap());
}

Result<void, Error> TransferCoordinator::beginSend(const QString& ip,
                                                   std::vector<storage::SourceInfo> sources) {
    QHostAddress address;
    if (!address.setAddress(ip)) {
        return Result<void, Error>::err(
            Error{ErrorKind::InvalidArgument, QStringLiteral("invalid peer address '%1'").arg(ip)});
    }
    if (sending_) {
        return Result<void, Error>::err(
            Error{ErrorKind::InvalidArgument, "a send is already in progress"});
    }

    const auto total = static_cast<quint32>(sources.size());
    std::vector<TransferSession> sessions;
    sessions.reserve(sources.size());
    for (quint32 i = 0; i < total; ++i) {
        const auto& source = sources[i];
        sessions.emplace_back(TransferDirection::Send,
                              source.relative_path.value_or(source.name),
                              source.size, i, total);
    }

    peer_ip_ = ip;
    sources_ = std::move(sources);
    queue_ = TransferQueue(std::move(sessions));
    sending_ = true;
    state_->clearSendCancel();

    qCInfo(lcTransfer) << "sending" << total << "file(s) to" << ip;
    advance();
    return Result<void, Error>::ok();
}

void TransferCoordinator::advance() {
    if (state_->sendCancelRequested()) {
        state_->clearSendCancel();
        queue_.abortRemaining(ErrorKind::CancelledByLocal);
        finishSend(TransferState::Cancelled, ErrorKind::CancelledByLocal,
                   QStringLiteral("Cancelled"), QString());
        return;
    }

    const auto next = queue_.advance();
    if (!next) {
        finishSend(TransferState::Completed, ErrorKind::Unknown, QString(), QString());
        return;
    }

    auto& session = queue_.at(*next);
    emit fileSending(session.fileName(), session.sequenceIndex(), session.sequenceTotal());

    auto* transfer = new OutgoingTransfer(sources_.at(*next), session,
                                          network::ws_url(peer_ip_, config_.peer_port),
                                          *storage_, state_, this);
    connect(transfer, &OutgoingTransfer::progress, this, &TransferCoordinator::sendProgress);
    connect(transfer, &OutgoingTransfer::finished, this, &TransferCoordinator::onOutgoingFinished);
    current_ = transfer;
    transfer->start();
}

void TransferCoordinator::onOutgoingFinished() {
    auto* transfer = current_.data();
    current_.clear();
    if (!transfer) return;

    const auto& session = transfer->session();
    const QString name = session.fileName();
    const TransferState outcome = session.state();
    const std::optional<Error> error = session.error();
    transfer->deleteLater();

    if (outcome == TransferState::Completed) {
        emit fileSent(name);
        advance();
        return;
    }

    const ErrorKind reason = error ? error->kind : ErrorKind::Unknown;
    if (reason == ErrorKind::CancelledByLocal) {
        state_->clearSendCancel();
    }
    queue_.abortRemaining(reason);
    finishSend(outcome, reason, error ? error->qmessage() : QString(), name);
}

void TransferCoordinator::finishSend(TransferState state,
                                     ErrorKind reason,
                                     const QString& message,
                                     const QString& file) {
    SendOutcome outcome;
    outcome.peer_ip = peer_ip_;
    outcome.state = state;
    outcome.reason = reason;
    outcome.message = message;
    outcome.file_name = file;
    outcome.files_sent = static_cast<int>(queue_.countIn(TransferState::Completed));
    outcome.files_total = static_cast<int>(queue_.size());
    sending_ = false;

    qCInfo(lcTransfer) << "send to" << peer_ip_ << "finished:" << to_string(state)
                       << outcome.files_sent << "/" << outcome.files_total;
    emit sendFinished(outcome);
}

void TransferCoordinator::cancelSending() {
    if (!sending_) {
        return;
    }
    qCInfo(lcTransfer) << "send cancel requested";
    state_->requestSendCancel();
}

void TransferCoordinator::cancelReceiving() {
    qCInfo(lcTransfer) << "receive cancel requested";
    state_->requestReceiveCancel();
}

} // namespace lanlink::transfer
