#pragma once

#include "core/result.hpp"
#include "network/messages.hpp"
#include "network/peer_channel_hub.hpp"

#include <QObject>

#include <deque>
#include <memory>
#include <vector>

class QTimer;

namespace lanlink::core { class SyncState; }
namespace lanlink::platform { class ClipboardAccess; }

namespace lanlink::network {

struct ClipboardConfig {
    quint16 listen_port = kDefaultClipboardPort;
    quint16 peer_port = kDefaultClipboardPort;
    QString local_ip;
    int poll_interval_ms = 500;
};

struct ClipboardEntry {
    ClipboardMessage message;
    bool outgoing = false;
};

/**
 * ClipboardSyncManager - pushes clipboard text to every connected peer.
 *
 * Echo suppression: the hash of the last text sent or received is kept in
 * SyncState. Received text updates that hash before it is written to the
 * local clipboard, so the next poll sees it as already known.
 */
class ClipboardSyncManager : public QObject {
    Q_OBJECT

public:
    static constexpr size_t kHistoryLimit = 50;

    ClipboardSyncManager(ClipboardConfig config,
                         std::shared_ptr<core::SyncState> state,
                         platform::ClipboardAccess& clipboard,
                         QObject* parent = nullptr);
    ~ClipboardSyncManager() override;

    Result<quint16, Error> start();
    void stop();

    Result<void, Error> connectTo(const QString& ip, quint16 port = 0);
    void disconnectPeer(const QString& ip);
    void disconnectAll();

    void startPolling();
    void stopPolling();
    [[nodiscard]] bool isPolling() const;

    /**
     * One poll step: broadcast the clipboard if it changed since the last
     * text sent or received. Returns true if something was broadcast.
     */
    bool pollOnce();

    /**
     * Broadcast the current clipboard now. Fails on an empty clipboard.
     */
    Result<ClipboardMessage, Error> sendNow();

    [[nodiscard]] std::vector<ClipboardEntry> history() const;
    [[nodiscard]] QStringList peers() const { return hub_->peers(); }
    [[nodiscard]] bool isConnected(const QString& ip) const { return hub_->isConnected(ip); }
    [[nodiscard]] quint16 listenPort() const { return hub_->listenPort(); }

signals:
    void clipboardConnected(const QString& ip);
    void clipboardDisconnected(const QString& ip);
    void clipboardReceived(const lanlink::network::ClipboardMessage& message);
    void clipboardSent(const lanlink::network::ClipboardMessage& message, int peer_count);
    void clipboardServerError(const QString& message);
    void clipboardConnectFailed(const QString& ip, const QString& message);

private slots:
    void onPeerConnected(const QString& ip, lanlink::network::LinkRole role, bool first_leg);
    void onTextReceived(const QString& ip, const QString& text);

private:
    ClipboardMessage broadcast(const QString& content, const QString& hash);
    void remember(const ClipboardMessage& message, bool outgoing);

    ClipboardConfig config_;
    std::shared_ptr<core::SyncState> state_;
    platform::ClipboardAccess& clipboard_;
    std::unique_ptr<PeerChannelHub> hub_;
    std::unique_ptr<QTimer> poll_timer_;

    QString last_polled_hash_;
    std::deque<ClipboardEntry> history_;
};

} // namespace lanlink::network
