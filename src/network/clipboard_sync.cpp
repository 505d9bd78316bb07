#include "network/clipboard_sync.hpp"

#include "core/log.hpp"
#include "core/sync_state.hpp"
#include "crypto/digest.hpp"
#include "platform/clipboard.hpp"

#include <QDateTime>
#include <QTimer>

namespace lanlink::network {

ClipboardSyncManager::ClipboardSyncManager(ClipboardConfig config,
                                           std::shared_ptr<core::SyncState> state,
                                           platform::ClipboardAccess& clipboard,
                                           QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , state_(std::move(state))
    , clipboard_(clipboard)
    , hub_(std::make_unique<PeerChannelHub>(
          HubConfig{.name = QStringLiteral("clipboard"),
                    .listen_port = config_.listen_port,
                    .peer_port = config_.peer_port,
                    .local_ip = config_.local_ip},
          this))
    , poll_timer_(std::make_unique<QTimer>(this))
{
    poll_timer_->setInterval(config_.poll_interval_ms);
    connect(poll_timer_.get(), &QTimer::timeout, this, [this]() { pollOnce(); });

    connect(hub_.get(), &PeerChannelHub::peerConnected,
            this, &ClipboardSyncManager::onPeerConnected);
    connect(hub_.get(), &PeerChannelHub::peerDisconnected,
            this, &ClipboardSyncManager::clipboardDisconnected);
    connect(hub_.get(), &PeerChannelHub::textReceived,
            this, &ClipboardSyncManager::onTextReceived);
    connect(hub_.get(), &PeerChannelHub::serverError,
            this, &ClipboardSyncManager::clipboardServerError);
    connect(hub_.get(), &PeerChannelHub::dialFailed, this,
            [this](const QString& ip, const Error& error) {
        qCWarning(lcClipboard).noquote() << error.qmessage();
        emit clipboardConnectFailed(ip, error.qmessage());
    });
}

ClipboardSyncManager::~ClipboardSyncManager() {
    poll_timer_->stop();
}

Result<quint16, Error> ClipboardSyncManager::start() {
    auto result = hub_->listen();
    if (result.is_ok()) {
        qCInfo(lcClipboard) << "clipboard listening on port" << result.unwrap();
    } else {
        qCWarning(lcClipboard).noquote() << result.unwrap_err().qmessage();
    }
    return result;
}

void ClipboardSyncManager::stop() {
    stopPolling();
    hub_->stopListening();
    hub_->closeAll();
}

Result<void, Error> ClipboardSyncManager::connectTo(const QString& ip, quint16 port) {
    return hub_->dial(ip, port);
}

void ClipboardSyncManager::disconnectPeer(const QString& ip) {
    hub_->closePeer(ip);
}

void ClipboardSyncManager::disconnectAll() {
    hub_->closeAll();
}

void ClipboardSyncManager::startPolling() {
    if (poll_timer_->isActive()) return;
    qCInfo(lcClipboard) << "clipboard polling started";
    poll_timer_->start();
}

void ClipboardSyncManager::stopPolling() {
    if (!poll_timer_->isActive()) return;
    qCInfo(lcClipboard) << "clipboard polling stopped";
    poll_timer_->stop();
}

bool ClipboardSyncManager::isPolling() const {
    return poll_timer_->isActive();
}

bool ClipboardSyncManager::pollOnce() {
    auto text = clipboard_.text();
    if (text.is_err()) {
        qCDebug(lcClipboard).noquote() << "clipboard read failed:" << text.unwrap_err().qmessage();
        return false;
    }

    const QString content = text.unwrap();
    if (content.isEmpty()) {
        return false;
    }

    const QString hash = crypto::content_hash(content);
    if (hash == state_->lastClipboardHash() || hash == last_polled_hash_) {
        return false;
    }

    last_polled_hash_ = hash;
    state_->setLastClipboardHash(hash);
    broadcast(content, hash);
    return true;
}

Result<ClipboardMessage, Error> ClipboardSyncManager::sendNow() {
    auto text = clipboard_.text();
    if (text.is_err()) {
        return Result<ClipboardMessage, Error>::err(text.unwrap_err());
    }

    const QString content = text.unwrap();
    if (content.isEmpty()) {
        return Result<ClipboardMessage, Error>::err(
            Error{ErrorKind::InvalidArgument, "Clipboard is empty"});
    }

    const QString hash = crypto::content_hash(content);
    last_polled_hash_ = hash;
    state_->setLastClipboardHash(hash);
    return Result<ClipboardMessage, Error>::ok(broadcast(content, hash));
}

ClipboardMessage ClipboardSyncManager::broadcast(const QString& content, const QString& hash) {
    ClipboardMessage message{content, config_.local_ip, QDateTime::currentMSecsSinceEpoch(), hash};
    const QStringList delivered = hub_->broadcastText(encode_clipboard_message(message));
    qCDebug(lcClipboard) << "clipboard sent to" << delivered.size() << "peer(s)";

    remember(message, true);
    emit clipboardSent(message, static_cast<int>(delivered.size()));
    return message;
}

void ClipboardSyncManager::onPeerConnected(const QString& ip, LinkRole role, bool first_leg) {
    Q_UNUSED(role)
    if (first_leg) {
        qCInfo(lcClipboard) << "clipboard peer connected" << ip;
        emit clipboardConnected(ip);
    }
}

void ClipboardSyncManager::onTextReceived(const QString& ip, const QString& text) {
    auto decoded = decode_clipboard_message(text);
    if (decoded.is_err()) {
        qCWarning(lcClipboard).noquote() << "dropping clipboard frame from" << ip << ":"
                                         << decoded.unwrap_err().qmessage();
        return;
    }

    const auto message = decoded.unwrap();

    // Record the hash first so the poll loop does not bounce this text back.
    const QString local_hash = crypto::content_hash(message.content);
    state_->setLastClipboardHash(local_hash);
    last_polled_hash_ = local_hash;

    auto applied = clipboard_.setText(message.content);
    if (applied.is_err()) {
        qCWarning(lcClipboard).noquote() << "cannot write clipboard:" << applied.unwrap_err().qmessage();
    }

    remember(message, false);
    emit clipboardReceived(message);
}

void ClipboardSyncManager::remember(const ClipboardMessage& message, bool outgoing) {
    history_.push_back(ClipboardEntry{message, outgoing});
    while (history_.size() > kHistoryLimit) {
        history_.pop_front();
    }
}

std::vector<ClipboardEntry> ClipboardSyncManager::history() const {
    return {history_.begin(), history_.end()};
}

} // namespace lanlink::network
