#pragma once

#include "app/settings.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/peer_registry.hpp"

#include <QJsonArray>
#include <QJsonObject>
#include <QObject>

#include <memory>
#include <vector>

namespace lanlink::core { class SyncState; }
namespace lanlink::network {
class ChatConnectionManager;
class ClipboardSyncManager;
class DiscoveryBeacon;
}
namespace lanlink::platform { class ClipboardAccess; }
namespace lanlink::storage { class StorageBackend; }
namespace lanlink::transfer { class TransferCoordinator; }

namespace lanlink::app {

[[nodiscard]] QJsonArray devices_to_json(const std::vector<network::Device>& devices);

/**
 * Node - one running LAN peer: discovery, file transfer, chat and clipboard.
 *
 * Owns the shared SyncState and the managers, and republishes every manager
 * signal as a named event with a JSON payload for the front end.
 */
class Node : public QObject {
    Q_OBJECT

public:
    Node(NodeSettings settings,
         std::shared_ptr<core::SyncState> state,
         std::shared_ptr<storage::StorageBackend> storage,
         platform::ClipboardAccess& clipboard,
         QObject* parent = nullptr);
    ~Node() override;

    /**
     * Start every subsystem. A subsystem that fails to bind is reported and
     * left stopped; the others keep running. The returned error lists the
     * failures.
     */
    Result<void, Error> start();
    void stop();

    /**
     * Change where incoming files are written. Takes effect for the next
     * accepted connection.
     */
    Result<void, Error> setSaveDir(const QString& dir);

    [[nodiscard]] QString localIp() const { return local_ip_; }
    [[nodiscard]] InstanceId instanceId() const { return instance_id_; }
    [[nodiscard]] const NodeSettings& settings() const { return settings_; }

    [[nodiscard]] core::SyncState& state() { return *state_; }
    [[nodiscard]] network::DiscoveryBeacon& discovery() { return *beacon_; }
    [[nodiscard]] transfer::TransferCoordinator& transfers() { return *transfers_; }
    [[nodiscard]] network::ChatConnectionManager& chat() { return *chat_; }
    [[nodiscard]] network::ClipboardSyncManager& clipboard() { return *clipboard_; }

signals:
    void event(const QString& name, const QJsonObject& payload);

private:
    void wireDiscovery();
    void wireTransfers();
    void wireChat();
    void wireClipboard();

    NodeSettings settings_;
    QString local_ip_;
    InstanceId instance_id_;

    std::shared_ptr<core::SyncState> state_;
    std::shared_ptr<storage::StorageBackend> storage_;

    std::unique_ptr<network::DiscoveryBeacon> beacon_;
    std::unique_ptr<transfer::TransferCoordinator> transfers_;
    std::unique_ptr<network::ChatConnectionManager> chat_;
    std::unique_ptr<network::ClipboardSyncManager> clipboard_;
};

} // namespace lanlink::app
