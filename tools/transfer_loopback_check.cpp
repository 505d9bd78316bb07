#include <QCoreApplication>
#include <QCryptographicHash>
#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QTemporaryDir>
#include <QTimer>

#include <memory>

#include "core/sync_state.hpp"
#include "crypto/digest.hpp"
#include "storage/local_file_storage.hpp"
#include "transfer/transfer_coordinator.hpp"

using lanlink::transfer::SendOutcome;
using lanlink::transfer::TransferConfig;
using lanlink::transfer::TransferCoordinator;
using lanlink::transfer::TransferState;

namespace {

QByteArray sha256_of(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    QCryptographicHash hash(QCryptographicHash::Sha256);
    hash.addData(&file);
    return hash.result();
}

} // namespace

// Sends one file between two in-process coordinators over 127.0.0.1 and
// checks that the copy is identical. Usage: transfer_loopback_check [size_mb] [port]
int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    const auto args = app.arguments();
    const qint64 size_mb = args.size() > 1 ? args.at(1).toLongLong() : 8;
    const quint16 port = args.size() > 2 ? static_cast<quint16>(args.at(2).toUInt()) : 47878;

    if (lanlink::crypto::init().is_err()) {
        qCritical() << "libsodium init failed";
        return 1;
    }

    QTemporaryDir outbox;
    QTemporaryDir inbox;
    if (!outbox.isValid() || !inbox.isValid()) {
        return 1;
    }

    const auto source = outbox.filePath(QStringLiteral("payload.bin"));
    {
        QFile file(source);
        if (!file.open(QIODevice::WriteOnly)) {
            return 1;
        }
        QByteArray block(1024 * 1024, Qt::Uninitialized);
        for (qint64 mb = 0; mb < size_mb; ++mb) {
            randombytes_buf(block.data(), static_cast<size_t>(block.size()));
            if (file.write(block) != block.size()) {
                return 1;
            }
        }
    }

    auto make_state = [](const QString& dir) { return std::make_shared<lanlink::core::SyncState>(dir); };
    auto receiver_state = make_state(inbox.path());
    auto sender_state = make_state(outbox.path());

    TransferCoordinator receiver(TransferConfig{.listen_port = port, .peer_port = port}, receiver_state,
                                 std::make_shared<lanlink::storage::LocalFileStorage>(receiver_state));
    TransferCoordinator sender(TransferConfig{.listen_port = 0, .peer_port = port}, sender_state,
                               std::make_shared<lanlink::storage::LocalFileStorage>(sender_state));

    if (receiver.startReceiver(inbox.path()).is_err()) {
        return 1;
    }

    bool received = false;
    bool finished = false;
    SendOutcome outcome;

    QObject::connect(&receiver, &TransferCoordinator::fileReceived, &app,
                     [&](const QString&, quint64 bytes, const QString&) {
        qInfo() << "received" << bytes << "bytes";
        received = true;
    });
    QObject::connect(&sender, &TransferCoordinator::sendFinished, &app, [&](const SendOutcome& o) {
        outcome = o;
        finished = true;
    });

    const auto sent = sender.sendFiles(QStringLiteral("127.0.0.1"), {source});
    if (sent.is_err()) {
        qCritical().noquote() << sent.unwrap_err().qmessage();
        return 1;
    }

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    timeout.setInterval(60000);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    QTimer poll;
    poll.setInterval(20);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (received && finished) {
            loop.quit();
        }
    });

    timeout.start();
    poll.start();
    loop.exec();

    if (!received || !finished || outcome.state != TransferState::Completed) {
        qCritical() << "transfer did not complete";
        return 2;
    }

    const auto copy = QDir(inbox.path()).filePath(QStringLiteral("payload.bin"));
    if (sha256_of(source) != sha256_of(copy)) {
        qCritical() << "received file differs";
        return 3;
    }
    qInfo() << "ok";
    return 0;
}
