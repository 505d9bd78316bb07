#include "app/node.hpp"

#include "core/log.hpp"
#include "core/sync_state.hpp"
#include "crypto/digest.hpp"
#include "network/chat_manager.hpp"
#include "network/clipboard_sync.hpp"
#include "network/discovery_beacon.hpp"
#include "network/local_address.hpp"
#include "storage/storage_backend.hpp"
#include "transfer/transfer_coordinator.hpp"

#include <QDir>
#include <QJsonArray>

namespace lanlink::app {

namespace {

InstanceId make_instance_id() {
    crypto::init().inspect_err([](const Error& error) {
        qCCritical(lcNode).noquote() << error.qmessage();
    });
    return crypto::random_instance_id();
}

// Sender progress counts bytes_sent, receiver progress counts bytes_received.
QJsonObject progress_json(const transfer::TransferProgress& progress, const QString& bytes_key) {
    QJsonObject obj;
    obj["file_name"] = progress.file_name;
    obj[bytes_key] = static_cast<qint64>(progress.bytes_transferred);
    obj["total_bytes"] = static_cast<qint64>(progress.total_bytes);
    obj["percentage"] = progress.percentage;
    return obj;
}

QJsonObject ip_json(const QString& ip) {
    QJsonObject obj;
    obj["ip"] = ip;
    return obj;
}

QJsonObject message_json(const QString& message) {
    QJsonObject obj;
    obj["message"] = message;
    return obj;
}

} // namespace

QJsonArray devices_to_json(const std::vector<network::Device>& devices) {
    QJsonArray list;
    for (const auto& device : devices) {
        QJsonObject obj;
        obj["ip"] = device.ip;
        obj["hostname"] = device.hostname;
        obj["instance_id"] = static_cast<qint64>(device.instance_id);
        obj["last_seen"] = static_cast<qint64>(device.last_seen.millis());
        list.append(obj);
    }
    return list;
}

Node::Node(NodeSettings settings,
           std::shared_ptr<core::SyncState> state,
           std::shared_ptr<storage::StorageBackend> storage,
           platform::ClipboardAccess& clipboard,
           QObject* parent)
    : QObject(parent)
    , settings_(std::move(settings))
    , local_ip_(settings_.local_ip.isEmpty() ? network::detect_local_ip() : settings_.local_ip)
    , instance_id_(make_instance_id())
    , state_(std::move(state))
    , storage_(std::move(storage))
{
    if (!settings_.save_dir.isEmpty()) {
        state_->setSaveDir(settings_.save_dir);
    }

    network::BeaconConfig beacon_config;
    beacon_config.port = settings_.discovery_port;
    beacon_config.multicast_group = settings_.multicast_group;
    beacon_config.local_ip = local_ip_;
    beacon_config.hostname = settings_.hostname;
    beacon_config.instance_id = instance_id_;
    beacon_ = std::make_unique<network::DiscoveryBeacon>(beacon_config, this);

    transfers_ = std::make_unique<transfer::TransferCoordinator>(
        transfer::TransferConfig{.listen_port = settings_.transfer_port,
                                 .peer_port = settings_.transfer_port},
        state_, storage_, this);

    network::ChatConfig chat_config;
    chat_config.listen_port = settings_.chat_port;
    chat_config.peer_port = settings_.chat_port;
    chat_config.local_ip = local_ip_;
    chat_ = std::make_unique<network::ChatConnectionManager>(chat_config, this);

    network::ClipboardConfig clipboard_config;
    clipboard_config.listen_port = settings_.clipboard_port;
    clipboard_config.peer_port = settings_.clipboard_port;
    clipboard_config.local_ip = local_ip_;
    clipboard_ = std::make_unique<network::ClipboardSyncManager>(clipboard_config, state_, clipboard, this);

    wireDiscovery();
    wireTransfers();
    wireChat();
    wireClipboard();
}

Node::~Node() {
    stop();
}

Result<void, Error> Node::start() {
    qCInfo(lcNode) << "starting node" << settings_.hostname << "ip=" << local_ip_
                   << "instance=" << instance_id_;

    QStringList failures;
    auto note = [&failures](const Error& error) { failures.append(error.qmessage()); };

    // Discovery failures stay local to discovery; the other protocols work with a typed-in IP.
    beacon_->start().inspect_err(note);
    transfers_->startReceiver(state_->saveDir()).inspect_err(note);
    chat_->start().inspect_err(note);
    clipboard_->start().inspect_err(note);

    if (!failures.isEmpty()) {
        return Result<void, Error>::err(
            Error{ErrorKind::NetworkBindFailure, failures.join(QStringLiteral("; "))});
    }
    return Result<void, Error>::ok();
}

void Node::stop() {
    clipboard_->stop();
    chat_->stop();
    transfers_->stopReceiver();
    beacon_->stop();
}

Result<void, Error> Node::setSaveDir(const QString& dir) {
    if (dir.isEmpty() || !QDir().mkpath(dir)) {
        return Result<void, Error>::err(
            Error{ErrorKind::InvalidArgument, QStringLiteral("cannot use '%1' as save directory").arg(dir)});
    }
    if (transfers_->isReceiving()) {
        auto updated = transfers_->startReceiver(dir);
        if (updated.is_err()) {
            return Result<void, Error>::err(updated.unwrap_err());
        }
    } else {
        state_->setSaveDir(dir);
    }
    emit event(QStringLiteral("save-dir-changed"), QJsonObject{{"path", dir}});
    return Result<void, Error>::ok();
}

void Node::wireDiscovery() {
    connect(beacon_.get(), &network::DiscoveryBeacon::devicesChanged, this,
            [this](const std::vector<network::Device>& devices) {
        emit event(QStringLiteral("devices-changed"), QJsonObject{{"devices", devices_to_json(devices)}});
    });
    connect(beacon_.get(), &network::DiscoveryBeacon::discoveryError, this, [this](const QString& message) {
        emit event(QStringLiteral("discovery-error"), message_json(message));
    });
}

void Node::wireTransfers() {
    using transfer::TransferCoordinator;
    auto* t = transfers_.get();

    connect(t, &TransferCoordinator::fileSending, this,
            [this](const QString& name, quint32 index, quint32 total) {
        emit event(QStringLiteral("file-sending"),
                   QJsonObject{{"name", name}, {"index", static_cast<qint64>(index)},
                               {"total", static_cast<qint64>(total)}});
    });
    connect(t, &TransferCoordinator::sendProgress, this, [this](const transfer::TransferProgress& p) {
        emit event(QStringLiteral("send-progress"), progress_json(p, QStringLiteral("bytes_sent")));
    });
    connect(t, &TransferCoordinator::fileSent, this, [this](const QString& name) {
        emit event(QStringLiteral("file-sent"), QJsonObject{{"name", name}});
    });
    connect(t, &TransferCoordinator::sendFinished, this, [this](const transfer::SendOutcome& outcome) {
        QJsonObject obj;
        obj["ip"] = outcome.peer_ip;
        obj["state"] = QString::fromLatin1(transfer::to_string(outcome.state));
        obj["reason"] = QString::fromLatin1(to_string(outcome.reason));
        obj["message"] = outcome.message;
        obj["file_name"] = outcome.file_name;
        obj["files_sent"] = outcome.files_sent;
        obj["files_total"] = outcome.files_total;
        emit event(QStringLiteral("send-finished"), obj);
    });

    connect(t, &TransferCoordinator::fileReceivingStarted, this,
            [this](const QString& name, quint32 index, quint32 total) {
        emit event(QStringLiteral("file-receiving-started"),
                   QJsonObject{{"name", name}, {"index", static_cast<qint64>(index)},
                               {"total", static_cast<qint64>(total)}});
    });
    connect(t, &TransferCoordinator::receiveProgress, this, [this](const transfer::TransferProgress& p) {
        emit event(QStringLiteral("transfer-progress"), progress_json(p, QStringLiteral("bytes_received")));
    });
    connect(t, &TransferCoordinator::fileReceived, this,
            [this](const QString& name, quint64 bytes, const QString& location) {
        emit event(QStringLiteral("file-received"),
                   QJsonObject{{"name", name}, {"size", static_cast<qint64>(bytes)}, {"path", location}});
    });
    connect(t, &TransferCoordinator::fileReceiveCancelled, this,
            [this](const QString& name, ErrorKind reason) {
        emit event(QStringLiteral("file-receive-cancelled"),
                   QJsonObject{{"name", name}, {"reason", QString::fromLatin1(to_string(reason))}});
    });
    connect(t, &TransferCoordinator::fileReceiveFailed, this,
            [this](const QString& name, const QString& message) {
        emit event(QStringLiteral("file-receive-failed"),
                   QJsonObject{{"name", name}, {"message", message}});
    });
    connect(t, &TransferCoordinator::receiverError, this, [this](const QString& message) {
        emit event(QStringLiteral("transfer-server-error"), message_json(message));
    });
}

void Node::wireChat() {
    using network::ChatConnectionManager;
    auto* c = chat_.get();

    connect(c, &ChatConnectionManager::chatConnected, this, [this](const QString& ip) {
        emit event(QStringLiteral("chat-connected"), ip_json(ip));
    });
    connect(c, &ChatConnectionManager::chatDisconnected, this, [this](const QString& ip) {
        emit event(QStringLiteral("chat-disconnected"), ip_json(ip));
    });
    connect(c, &ChatConnectionManager::chatMessageReceived, this,
            [this](const network::ChatMessage& message) {
        emit event(QStringLiteral("chat-message-received"),
                   QJsonObject{{"content", message.content},
                               {"from_ip", message.from_ip},
                               {"timestamp", message.timestamp}});
    });
    connect(c, &ChatConnectionManager::chatServerError, this, [this](const QString& message) {
        emit event(QStringLiteral("chat-server-error"), message_json(message));
    });
    connect(c, &ChatConnectionManager::chatConnectFailed, this,
            [this](const QString& ip, const QString& message) {
        emit event(QStringLiteral("chat-connect-failed"), QJsonObject{{"ip", ip}, {"message", message}});
    });
    connect(c, &ChatConnectionManager::sessionChanged, this, [this](const QString& peer, bool connected) {
        emit event(QStringLiteral("chat-session"), QJsonObject{{"peer", peer}, {"connected", connected}});
    });
}

void Node::wireClipboard() {
    using network::ClipboardSyncManager;
    auto* c = clipboard_.get();

    auto clip_json = [](const network::ClipboardMessage& message) {
        return QJsonObject{{"content", message.content},
                           {"from_ip", message.from_ip},
                           {"timestamp", message.timestamp},
                           {"hash", message.hash}};
    };

    connect(c, &ClipboardSyncManager::clipboardConnected, this, [this](const QString& ip) {
        emit event(QStringLiteral("clipboard-connected"), ip_json(ip));
    });
    connect(c, &ClipboardSyncManager::clipboardDisconnected, this, [this](const QString& ip) {
        emit event(QStringLiteral("clipboard-disconnected"), ip_json(ip));
    });
    connect(c, &ClipboardSyncManager::clipboardReceived, this,
            [this, clip_json](const network::ClipboardMessage& message) {
        emit event(QStringLiteral("clipboard-received"), clip_json(message));
    });
    connect(c, &ClipboardSyncManager::clipboardSent, this,
            [this, clip_json](const network::ClipboardMessage& message, int peer_count) {
        auto obj = clip_json(message);
        obj["peers"] = peer_count;
        emit event(QStringLiteral("clipboard-sent"), obj);
    });
    connect(c, &ClipboardSyncManager::clipboardServerError, this, [this](const QString& message) {
        emit event(QStringLiteral("clipboard-server-error"), message_json(message));
    });
    connect(c, &ClipboardSyncManager::clipboardConnectFailed, this,
            [this](const QString& ip, const QString& message) {
        emit event(QStringLiteral("clipboard-connect-failed"), QJsonObject{{"ip", ip}, {"message", message}});
    });
}

} // namespace lanlink::app
