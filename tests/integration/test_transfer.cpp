#include <catch2/catch_test_macros.hpp>

#include "core/sync_state.hpp"
#include "network/transport.hpp"
#include "storage/local_file_storage.hpp"
#include "support/test_support.hpp"
#include "transfer/file_meta.hpp"
#include "transfer/outgoing_transfer.hpp"
#include "transfer/transfer_coordinator.hpp"

#include <QDir>
#include <QFile>
#include <QHostAddress>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QThread>
#include <QTimer>
#include <QWebSocket>
#include <QWebSocketServer>

#include <algorithm>
#include <atomic>

using namespace lanlink;
using namespace lanlink::transfer;
using namespace std::chrono_literals;

namespace {

struct Endpoint {
    explicit Endpoint(quint16 listen_port, quint16 peer_port, const QString& save_dir)
        : state(std::make_shared<core::SyncState>(save_dir))
        , storage(std::make_shared<storage::LocalFileStorage>(state))
        , coordinator(TransferConfig{.listen_port = listen_port, .peer_port = peer_port}, state, storage) {}

    std::shared_ptr<core::SyncState> state;
    std::shared_ptr<storage::LocalFileStorage> storage;
    TransferCoordinator coordinator;
};

struct TransferFixture {
    TransferFixture()
        : port(test::free_port())
        , receiver(port, port, inbox.path())
        , sender(0, port, inbox.path())
    {
        REQUIRE(inbox.isValid());
        REQUIRE(outbox.isValid());
        REQUIRE(receiver.coordinator.startReceiver(inbox.path()).is_ok());
    }

    QString source(const QString& name, const QByteArray& bytes) const {
        const auto path = outbox.filePath(name);
        test::write_file(path, bytes);
        return path;
    }

    QTemporaryDir inbox;
    QTemporaryDir outbox;
    quint16 port;
    Endpoint receiver;
    Endpoint sender;
};

SendOutcome outcome_of(const QSignalSpy& spy) {
    return spy.first().first().value<SendOutcome>();
}

// A WebSocket peer on its own thread that takes `delay_ms` over every frame.
class SlowReader {
public:
    explicit SlowReader(unsigned long delay_ms) {
        ctx_ = new QObject;
        ctx_->moveToThread(&thread_);
        QObject::connect(&thread_, &QThread::finished, ctx_, &QObject::deleteLater);
        thread_.start();

        QMetaObject::invokeMethod(ctx_, [this, delay_ms]() {
            auto* server = new QWebSocketServer(QStringLiteral("slow-reader"),
                                                QWebSocketServer::NonSecureMode, ctx_);
            if (server->listen(QHostAddress::LocalHost, 0)) {
                port_ = server->serverPort();
            }
            QObject::connect(server, &QWebSocketServer::newConnection, ctx_, [this, server, delay_ms]() {
                QWebSocket* socket = server->nextPendingConnection();
                socket->setParent(ctx_);
                QObject::connect(socket, &QWebSocket::binaryMessageReceived, ctx_,
                                 [this, delay_ms](const QByteArray& frame) {
                    QThread::msleep(delay_ms);
                    bytes_.fetch_add(frame.size());
                });
                QObject::connect(socket, &QWebSocket::disconnected, ctx_, [this]() {
                    closed_.store(true);
                });
            });
        }, Qt::BlockingQueuedConnection);
    }

    ~SlowReader() {
        thread_.quit();
        thread_.wait();
    }

    [[nodiscard]] quint16 port() const { return port_; }
    [[nodiscard]] qint64 bytes() const { return bytes_.load(); }
    [[nodiscard]] bool closed() const { return closed_.load(); }

private:
    QThread thread_;
    QObject* ctx_ = nullptr;
    quint16 port_ = 0;
    std::atomic<qint64> bytes_{0};
    std::atomic<bool> closed_{false};
};

} // namespace

TEST_CASE("Transfer: a file arrives byte-identical", "[integration][transfer]") {
    TransferFixture f;
    const auto payload = test::make_payload(1'300'000, 3);
    const auto path = f.source(QStringLiteral("photo.jpg"), payload);

    QSignalSpy received(&f.receiver.coordinator, &TransferCoordinator::fileReceived);
    QSignalSpy started(&f.receiver.coordinator, &TransferCoordinator::fileReceivingStarted);
    QSignalSpy progress(&f.receiver.coordinator, &TransferCoordinator::receiveProgress);
    QSignalSpy finished(&f.sender.coordinator, &TransferCoordinator::sendFinished);
    QSignalSpy sent(&f.sender.coordinator, &TransferCoordinator::fileSent);

    REQUIRE(f.sender.coordinator.sendFiles(QStringLiteral("127.0.0.1"), {path}).is_ok());
    REQUIRE(f.sender.coordinator.isSending());

    REQUIRE(test::wait_until([&] { return received.count() == 1 && finished.count() == 1; }, 10s));

    REQUIRE(started.count() == 1);
    REQUIRE(received.first().at(0).toString() == QStringLiteral("photo.jpg"));
    REQUIRE(received.first().at(1).value<quint64>() == 1'300'000u);
    REQUIRE(test::read_file(f.inbox.filePath(QStringLiteral("photo.jpg"))) == payload);

    // 100 KB steps plus the final one, never more than one per chunk.
    REQUIRE(progress.count() >= 2);
    const auto last = progress.last().first().value<TransferProgress>();
    REQUIRE(last.bytes_transferred == 1'300'000u);
    REQUIRE(last.percentage == 100.0);

    REQUIRE(sent.count() == 1);
    const auto outcome = outcome_of(finished);
    REQUIRE(outcome.state == TransferState::Completed);
    REQUIRE(outcome.files_sent == 1);
    REQUIRE_FALSE(f.sender.coordinator.isSending());
    REQUIRE(test::wait_until([&] { return f.receiver.storage->openStreamCount() == 0; }));
    REQUIRE(f.receiver.storage->closedStreamCount() == 0);
}

TEST_CASE("Transfer: an empty file is received", "[integration][transfer]") {
    TransferFixture f;
    const auto path = f.source(QStringLiteral("empty.txt"), QByteArray());

    QSignalSpy received(&f.receiver.coordinator, &TransferCoordinator::fileReceived);
    REQUIRE(f.sender.coordinator.sendFiles(QStringLiteral("127.0.0.1"), {path}).is_ok());

    REQUIRE(test::wait_until([&] { return received.count() == 1; }));
    REQUIRE(QFile::exists(f.inbox.filePath(QStringLiteral("empty.txt"))));
}

TEST_CASE("Transfer: multiple files go one after another", "[integration][transfer]") {
    TransferFixture f;
    const auto big = test::make_payload(10 * 1024 * 1024, 7);
    const auto small = test::make_payload(1024, 8);
    const auto big_path = f.source(QStringLiteral("big.bin"), big);
    const auto small_path = f.source(QStringLiteral("small.bin"), small);

    QStringList order;
    QObject::connect(&f.receiver.coordinator, &TransferCoordinator::fileReceivingStarted,
                     [&](const QString& name, quint32 index, quint32 total) {
        order.append(QStringLiteral("%1:%2/%3").arg(name).arg(index).arg(total));
    });
    QObject::connect(&f.receiver.coordinator, &TransferCoordinator::fileReceived,
                     [&](const QString& name, quint64, const QString&) {
        order.append(QStringLiteral("done:%1").arg(name));
    });
    QSignalSpy finished(&f.sender.coordinator, &TransferCoordinator::sendFinished);

    REQUIRE(f.sender.coordinator.sendFiles(QStringLiteral("127.0.0.1"), {big_path, small_path}).is_ok());
    REQUIRE(test::wait_until([&] { return finished.count() == 1 && order.size() == 4; }, 30s));

    REQUIRE(order == QStringList{QStringLiteral("big.bin:0/2"), QStringLiteral("done:big.bin"),
                                 QStringLiteral("small.bin:1/2"), QStringLiteral("done:small.bin")});
    REQUIRE(outcome_of(finished).files_sent == 2);
    REQUIRE(test::read_file(f.inbox.filePath(QStringLiteral("big.bin"))) == big);
    REQUIRE(test::read_file(f.inbox.filePath(QStringLiteral("small.bin"))) == small);
}

TEST_CASE("Transfer: a second send while one is running is refused", "[integration][transfer]") {
    TransferFixture f;
    const auto path = f.source(QStringLiteral("a.bin"), test::make_payload(4 * 1024 * 1024));
    QSignalSpy finished(&f.sender.coordinator, &TransferCoordinator::sendFinished);

    REQUIRE(f.sender.coordinator.sendFiles(QStringLiteral("127.0.0.1"), {path}).is_ok());
    REQUIRE(f.sender.coordinator.sendFiles(QStringLiteral("127.0.0.1"), {path}).is_err());
    REQUIRE(test::wait_until([&] { return finished.count() == 1; }, 10s));
}

TEST_CASE("Transfer: bad send requests are rejected up front", "[integration][transfer]") {
    TransferFixture f;

    REQUIRE(f.sender.coordinator.sendFiles(QStringLiteral("127.0.0.1"), {}).unwrap_err().kind
            == ErrorKind::InvalidArgument);
    REQUIRE(f.sender.coordinator.sendFiles(QStringLiteral("127.0.0.1"),
                                           {f.outbox.filePath(QStringLiteral("missing"))}).is_err());
    const auto path = f.source(QStringLiteral("a.txt"), QByteArray("a"));
    REQUIRE(f.sender.coordinator.sendFiles(QStringLiteral("not an ip"), {path}).is_err());
    REQUIRE_FALSE(f.sender.coordinator.isSending());
}

TEST_CASE("Transfer: legacy sender without size", "[integration][transfer]") {
    TransferFixture f;
    QSignalSpy received(&f.receiver.coordinator, &TransferCoordinator::fileReceived);

    QWebSocket client;
    QObject::connect(&client, &QWebSocket::connected, [&] {
        client.sendTextMessage(QStringLiteral(R"({"name":"legacy.txt"})"));
        client.sendBinaryMessage(QByteArray("old "));
        client.sendBinaryMessage(QByteArray("client"));
        client.close();
    });
    client.open(network::ws_url(QStringLiteral("127.0.0.1"), f.port));

    REQUIRE(test::wait_until([&] { return received.count() == 1; }));
    REQUIRE(test::read_file(f.inbox.filePath(QStringLiteral("legacy.txt"))) == QByteArray("old client"));
}

TEST_CASE("Transfer: a legacy sender that drops the connection leaves no file", "[integration][transfer]") {
    TransferFixture f;
    QSignalSpy received(&f.receiver.coordinator, &TransferCoordinator::fileReceived);
    QSignalSpy failed(&f.receiver.coordinator, &TransferCoordinator::fileReceiveFailed);
    QSignalSpy progress(&f.receiver.coordinator, &TransferCoordinator::receiveProgress);

    QWebSocket client;
    QObject::connect(&client, &QWebSocket::connected, [&] {
        client.sendTextMessage(QStringLiteral(R"({"name":"dropped.bin"})"));
        for (int i = 0; i < 3; ++i) {
            client.sendBinaryMessage(test::make_payload(128 * 1024, static_cast<quint32>(i)));
        }
    });
    client.open(network::ws_url(QStringLiteral("127.0.0.1"), f.port));

    // Bytes are on disk before the connection goes away without a close frame.
    REQUIRE(test::wait_until([&] { return progress.count() >= 1; }));
    client.abort();

    REQUIRE(test::wait_until([&] { return failed.count() == 1; }));
    REQUIRE(failed.first().at(0).toString() == QStringLiteral("dropped.bin"));
    REQUIRE(received.count() == 0);
    REQUIRE_FALSE(QFile::exists(f.inbox.filePath(QStringLiteral("dropped.bin"))));
    REQUIRE(f.receiver.storage->openStreamCount() == 0);
}

TEST_CASE("Transfer: a close code other than normal discards a legacy file", "[integration][transfer]") {
    TransferFixture f;
    QSignalSpy received(&f.receiver.coordinator, &TransferCoordinator::fileReceived);
    QSignalSpy cancelled(&f.receiver.coordinator, &TransferCoordinator::fileReceiveCancelled);

    QWebSocket client;
    QObject::connect(&client, &QWebSocket::connected, [&] {
        client.sendTextMessage(QStringLiteral(R"({"name":"gone.txt"})"));
        client.sendBinaryMessage(QByteArray("half"));
        client.close(QWebSocketProtocol::CloseCodeGoingAway, QStringLiteral("bye"));
    });
    client.open(network::ws_url(QStringLiteral("127.0.0.1"), f.port));

    REQUIRE(test::wait_until([&] { return cancelled.count() == 1; }));
    REQUIRE(cancelled.first().at(1).value<ErrorKind>() == ErrorKind::CancelledByRemote);
    REQUIRE(received.count() == 0);
    REQUIRE_FALSE(QFile::exists(f.inbox.filePath(QStringLiteral("gone.txt"))));
}

TEST_CASE("Transfer: a short connection leaves no partial file", "[integration][transfer]") {
    TransferFixture f;
    QSignalSpy cancelled(&f.receiver.coordinator, &TransferCoordinator::fileReceiveCancelled);
    QSignalSpy received(&f.receiver.coordinator, &TransferCoordinator::fileReceived);

    QWebSocket client;
    QObject::connect(&client, &QWebSocket::connected, [&] {
        FileMeta meta;
        meta.name = QStringLiteral("short.bin");
        meta.size = 100;
        client.sendTextMessage(QString::fromUtf8(encode_file_meta(meta)));
        client.sendBinaryMessage(QByteArray(10, 'z'));
        client.close();
    });
    client.open(network::ws_url(QStringLiteral("127.0.0.1"), f.port));

    REQUIRE(test::wait_until([&] { return cancelled.count() == 1; }));
    REQUIRE(cancelled.first().at(1).value<ErrorKind>() == ErrorKind::CancelledByRemote);
    REQUIRE(received.count() == 0);
    REQUIRE_FALSE(QFile::exists(f.inbox.filePath(QStringLiteral("short.bin"))));
}

TEST_CASE("Transfer: path traversal in metadata stays inside the save directory", "[integration][transfer]") {
    TransferFixture f;
    QSignalSpy received(&f.receiver.coordinator, &TransferCoordinator::fileReceived);

    QWebSocket client;
    QObject::connect(&client, &QWebSocket::connected, [&] {
        client.sendTextMessage(QStringLiteral(
            R"({"name":"../../escape.txt","size":2,"relative_path":"../../escape.txt"})"));
        client.sendBinaryMessage(QByteArray("ok"));
        client.close();
    });
    client.open(network::ws_url(QStringLiteral("127.0.0.1"), f.port));

    REQUIRE(test::wait_until([&] { return received.count() == 1; }));
    REQUIRE(QFile::exists(f.inbox.filePath(QStringLiteral("escape.txt"))));
    REQUIRE(received.first().at(2).toString().startsWith(f.inbox.path()));
}

TEST_CASE("Transfer: sender cancel stops the queue", "[integration][transfer]") {
    TransferFixture f;
    const auto first = f.source(QStringLiteral("first.bin"), test::make_payload(24 * 1024 * 1024, 11));
    const auto second = f.source(QStringLiteral("second.bin"), test::make_payload(1024, 12));

    QSignalSpy finished(&f.sender.coordinator, &TransferCoordinator::sendFinished);
    QSignalSpy cancelled(&f.receiver.coordinator, &TransferCoordinator::fileReceiveCancelled);
    QSignalSpy failed(&f.receiver.coordinator, &TransferCoordinator::fileReceiveFailed);
    QSignalSpy received(&f.receiver.coordinator, &TransferCoordinator::fileReceived);
    QSignalSpy started(&f.receiver.coordinator, &TransferCoordinator::fileReceivingStarted);
    QObject::connect(&f.sender.coordinator, &TransferCoordinator::sendProgress,
                     &f.sender.coordinator, &TransferCoordinator::cancelSending);

    REQUIRE(f.sender.coordinator.sendFiles(QStringLiteral("127.0.0.1"), {first, second}).is_ok());
    // The receiver sees either the sender's close frame or a dropped connection.
    REQUIRE(test::wait_until([&] {
        return finished.count() == 1 && cancelled.count() + failed.count() == 1;
    }, 15s));
    REQUIRE(received.count() == 0);

    const auto outcome = outcome_of(finished);
    REQUIRE(outcome.state == TransferState::Cancelled);
    REQUIRE(outcome.reason == ErrorKind::CancelledByLocal);
    REQUIRE(outcome.files_sent == 0);
    REQUIRE(f.sender.coordinator.queue().countIn(TransferState::Cancelled) == 2);
    REQUIRE(started.count() == 1);
    REQUIRE_FALSE(QFile::exists(f.inbox.filePath(QStringLiteral("first.bin"))));
    REQUIRE_FALSE(f.sender.state->sendCancelRequested());
}

TEST_CASE("Transfer: receiver cancel is reported to the sender", "[integration][transfer]") {
    TransferFixture f;
    const auto path = f.source(QStringLiteral("movie.mkv"), test::make_payload(24 * 1024 * 1024, 5));

    QSignalSpy finished(&f.sender.coordinator, &TransferCoordinator::sendFinished);
    QSignalSpy cancelled(&f.receiver.coordinator, &TransferCoordinator::fileReceiveCancelled);
    QObject::connect(&f.receiver.coordinator, &TransferCoordinator::receiveProgress,
                     &f.receiver.coordinator, &TransferCoordinator::cancelReceiving);

    REQUIRE(f.sender.coordinator.sendFiles(QStringLiteral("127.0.0.1"), {path}).is_ok());
    REQUIRE(test::wait_until([&] { return finished.count() == 1 && cancelled.count() == 1; }, 15s));

    REQUIRE(cancelled.first().at(1).value<ErrorKind>() == ErrorKind::CancelledByLocal);
    const auto outcome = outcome_of(finished);
    REQUIRE(outcome.state == TransferState::Cancelled);
    REQUIRE(outcome.reason == ErrorKind::CancelledByRemote);
    REQUIRE_FALSE(QFile::exists(f.inbox.filePath(QStringLiteral("movie.mkv"))));
}

TEST_CASE("Transfer: a receive cancel does not reach the next connection", "[integration][transfer]") {
    TransferFixture f;
    const auto big = f.source(QStringLiteral("big.bin"), test::make_payload(24 * 1024 * 1024, 6));
    const auto small = f.source(QStringLiteral("small.txt"), QByteArray("after the cancel"));

    QSignalSpy finished(&f.sender.coordinator, &TransferCoordinator::sendFinished);
    QSignalSpy cancelled(&f.receiver.coordinator, &TransferCoordinator::fileReceiveCancelled);
    QSignalSpy received(&f.receiver.coordinator, &TransferCoordinator::fileReceived);
    auto cancel_once = QObject::connect(&f.receiver.coordinator, &TransferCoordinator::receiveProgress,
                                        &f.receiver.coordinator, &TransferCoordinator::cancelReceiving);

    REQUIRE(f.sender.coordinator.sendFiles(QStringLiteral("127.0.0.1"), {big}).is_ok());
    REQUIRE(test::wait_until([&] { return finished.count() == 1 && cancelled.count() == 1; }, 15s));
    QObject::disconnect(cancel_once);

    REQUIRE(f.sender.coordinator.sendFiles(QStringLiteral("127.0.0.1"), {small}).is_ok());
    REQUIRE(test::wait_until([&] { return finished.count() == 2 && received.count() == 1; }));
    REQUIRE(outcome_of(finished).state == TransferState::Cancelled);
    REQUIRE(finished.last().first().value<SendOutcome>().state == TransferState::Completed);
    REQUIRE(test::read_file(f.inbox.filePath(QStringLiteral("small.txt"))) == QByteArray("after the cancel"));
}

TEST_CASE("Transfer: unreachable peer fails the send", "[integration][transfer]") {
    QTemporaryDir outbox;
    const auto dead_port = test::free_port();
    Endpoint sender(0, dead_port, outbox.path());
    const auto path = outbox.filePath(QStringLiteral("x.bin"));
    test::write_file(path, QByteArray("x"));

    QSignalSpy finished(&sender.coordinator, &TransferCoordinator::sendFinished);
    REQUIRE(sender.coordinator.sendFiles(QStringLiteral("127.0.0.1"), {path}).is_ok());
    REQUIRE(test::wait_until([&] { return finished.count() == 1; }, 15s));

    const auto outcome = outcome_of(finished);
    REQUIRE(outcome.state == TransferState::Failed);
    REQUIRE(outcome.reason == ErrorKind::PeerUnreachable);
    REQUIRE(outcome.file_name == QStringLiteral("x.bin"));
}

TEST_CASE("Transfer: save directory change applies to the next connection", "[integration][transfer]") {
    TransferFixture f;
    QTemporaryDir other;
    QSignalSpy received(&f.receiver.coordinator, &TransferCoordinator::fileReceived);
    QSignalSpy finished(&f.sender.coordinator, &TransferCoordinator::sendFinished);

    const auto a = f.source(QStringLiteral("a.txt"), QByteArray("a"));
    REQUIRE(f.sender.coordinator.sendFiles(QStringLiteral("127.0.0.1"), {a}).is_ok());
    REQUIRE(test::wait_until([&] { return received.count() == 1 && finished.count() == 1; }));

    // Re-starting the receiver only changes the directory.
    const auto port = f.receiver.coordinator.startReceiver(other.path());
    REQUIRE(port.unwrap() == f.port);
    REQUIRE(f.receiver.coordinator.receiverPort() == f.port);

    const auto b = f.source(QStringLiteral("b.txt"), QByteArray("b"));
    REQUIRE(f.sender.coordinator.sendFiles(QStringLiteral("127.0.0.1"), {b}).is_ok());
    REQUIRE(test::wait_until([&] { return received.count() == 2 && finished.count() == 2; }));

    REQUIRE(QFile::exists(f.inbox.filePath(QStringLiteral("a.txt"))));
    REQUIRE(QFile::exists(QDir(other.path()).filePath(QStringLiteral("b.txt"))));
    REQUIRE_FALSE(QFile::exists(f.inbox.filePath(QStringLiteral("b.txt"))));
}

TEST_CASE("Transfer: a folder keeps its structure", "[integration][transfer]") {
    TransferFixture f;
    const auto root = f.outbox.filePath(QStringLiteral("trip"));
    test::write_file(root + QStringLiteral("/day1/a.jpg"), QByteArray("aaa"));
    test::write_file(root + QStringLiteral("/notes.txt"), QByteArray("n"));

    QSignalSpy received(&f.receiver.coordinator, &TransferCoordinator::fileReceived);
    QSignalSpy finished(&f.sender.coordinator, &TransferCoordinator::sendFinished);

    REQUIRE(f.sender.coordinator.sendFolder(QStringLiteral("127.0.0.1"), root).is_ok());
    REQUIRE(test::wait_until([&] { return finished.count() == 1 && received.count() == 2; }));

    REQUIRE(outcome_of(finished).files_total == 2);
    REQUIRE(received.first().at(0).toString() == QStringLiteral("trip/day1/a.jpg"));
    REQUIRE(test::read_file(f.inbox.filePath(QStringLiteral("trip/day1/a.jpg"))) == QByteArray("aaa"));
    REQUIRE(test::read_file(f.inbox.filePath(QStringLiteral("trip/notes.txt"))) == QByteArray("n"));
}

TEST_CASE("Transfer: the receiver refuses a busy port", "[integration][transfer]") {
    TransferFixture f;
    QTemporaryDir dir;
    Endpoint second(f.port, f.port, dir.path());
    QSignalSpy errors(&second.coordinator, &TransferCoordinator::receiverError);

    const auto started = second.coordinator.startReceiver(dir.path());

    REQUIRE(started.is_err());
    REQUIRE(started.unwrap_err().kind == ErrorKind::NetworkBindFailure);
    REQUIRE(errors.count() == 1);
}

TEST_CASE("Transfer: a slow reader holds the send backlog near the high-water mark", "[integration][transfer]") {
    QTemporaryDir outbox;
    REQUIRE(outbox.isValid());
    constexpr qint64 kFileSize = 40LL * 1024 * 1024;
    const auto path = outbox.filePath(QStringLiteral("large.bin"));
    test::write_file(path, test::make_payload(kFileSize, 11));

    SlowReader reader(15);
    REQUIRE(reader.port() != 0);

    auto state = std::make_shared<core::SyncState>(outbox.path());
    storage::LocalFileStorage storage(state);
    auto source = storage.describe(path);
    REQUIRE(source.is_ok());

    TransferSession session(TransferDirection::Send, QStringLiteral("large.bin"),
                            static_cast<quint64>(kFileSize));
    OutgoingTransfer transfer(source.unwrap(), session,
                              network::ws_url(QStringLiteral("127.0.0.1"), reader.port()), storage, state);
    QSignalSpy finished(&transfer, &OutgoingTransfer::finished);

    qint64 max_backlog = 0;
    const auto sample = [&] { max_backlog = std::max(max_backlog, transfer.backlog()); };
    QObject::connect(&transfer, &OutgoingTransfer::progress, sample);
    QTimer sampler;
    QObject::connect(&sampler, &QTimer::timeout, sample);
    sampler.start(5);

    transfer.start();
    REQUIRE(test::wait_until([&] { return finished.count() == 1; }, 60s));
    sampler.stop();

    REQUIRE(session.state() == TransferState::Completed);
    REQUIRE(test::wait_until([&] { return reader.closed(); }));
    REQUIRE(reader.bytes() == kFileSize);
    REQUIRE(max_backlog > 0);
    // One chunk may be queued after the check, plus the metadata frame.
    REQUIRE(max_backlog <= OutgoingTransfer::kHighWaterMark + OutgoingTransfer::kChunkSize + 4096);
}
