#include "app/cli/console.hpp"

#include "app/node.hpp"
#include "app/settings.hpp"
#include "core/log.hpp"
#include "network/chat_manager.hpp"
#include "network/clipboard_sync.hpp"
#include "network/discovery_beacon.hpp"
#include "transfer/transfer_coordinator.hpp"

#include <QJsonDocument>
#include <QSettings>
#include <QSocketNotifier>
#include <QTextStream>

#include <unistd.h>

namespace lanlink::app {

Console::Console(Node& node, QSettings& settings, QObject* parent)
    : QObject(parent)
    , node_(node)
    , settings_(settings)
    , out_(std::make_unique<QTextStream>(stdout))
{
    connect(&node_, &Node::event, this, &Console::writeEvent);
}

Console::~Console() = default;

void Console::start() {
    if (notifier_) {
        return;
    }
    notifier_ = std::make_unique<QSocketNotifier>(STDIN_FILENO, QSocketNotifier::Read);
    connect(notifier_.get(), &QSocketNotifier::activated, this, &Console::onStdinReadable);
}

void Console::onStdinReadable() {
    char buffer[4096];
    const auto n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
    if (n <= 0) {
        // EOF on stdin ends the session the same way "quit" does.
        notifier_->setEnabled(false);
        emit quitRequested();
        return;
    }
    pending_.append(buffer, static_cast<qsizetype>(n));

    qsizetype newline = 0;
    while ((newline = pending_.indexOf('\n')) >= 0) {
        const auto line = QString::fromUtf8(pending_.left(newline));
        pending_.remove(0, newline + 1);
        handleLine(line);
    }
}

void Console::handleLine(const QString& line) {
    if (line.trimmed().isEmpty()) {
        return;
    }
    auto parsed = parse_command(line);
    if (parsed.is_err()) {
        writeEvent(QStringLiteral("command-error"),
                   QJsonObject{{"message", parsed.unwrap_err().qmessage()}});
        return;
    }
    execute(parsed.unwrap()).inspect_err([this](const Error& error) {
        writeEvent(QStringLiteral("command-error"),
                   QJsonObject{{"kind", QString::fromLatin1(to_string(error.kind))},
                               {"message", error.qmessage()}});
    });
}

Result<void, Error> Console::execute(const Command& command) {
    const auto& args = command.args;
    switch (command.kind) {
        case CommandKind::Devices:
            writeEvent(QStringLiteral("devices"),
                       QJsonObject{{"devices", devices_to_json(node_.discovery().devices())}});
            return Result<void, Error>::ok();

        case CommandKind::Send:
            return node_.transfers().sendFiles(args.first(), args.mid(1));

        case CommandKind::SendFolder:
            return node_.transfers().sendFolder(args.at(0), args.at(1));

        case CommandKind::CancelSend:
            node_.transfers().cancelSending();
            return Result<void, Error>::ok();

        case CommandKind::CancelReceive:
            node_.transfers().cancelReceiving();
            return Result<void, Error>::ok();

        case CommandKind::SaveDir: {
            auto changed = node_.setSaveDir(args.first());
            if (changed.is_ok()) {
                store_save_dir(settings_, args.first());
            }
            return changed;
        }

        case CommandKind::Chat:
            return node_.chat().openSession(args.first());

        case CommandKind::Say: {
            const auto peer = node_.chat().activePeer();
            if (peer.isEmpty()) {
                return Result<void, Error>::err(
                    Error{ErrorKind::NotConnected, "no chat session; use 'chat <ip>' first"});
            }
            auto sent = node_.chat().send(peer, args.first());
            if (sent.is_err()) {
                return Result<void, Error>::err(sent.unwrap_err());
            }
            const auto& message = sent.unwrap();
            writeEvent(QStringLiteral("chat-message-sent"),
                       QJsonObject{{"content", message.content},
                                   {"to_ip", peer},
                                   {"timestamp", message.timestamp}});
            return Result<void, Error>::ok();
        }

        case CommandKind::ChatClose:
            node_.chat().closeSession();
            return Result<void, Error>::ok();

        case CommandKind::ChatCloseAll:
            node_.chat().disconnectAll();
            return Result<void, Error>::ok();

        case CommandKind::ClipConnect:
            return node_.clipboard().connectTo(args.first());

        case CommandKind::ClipDisconnect:
            node_.clipboard().disconnectPeer(args.first());
            return Result<void, Error>::ok();

        case CommandKind::ClipPoll:
            if (args.first() == QLatin1String("on")) {
                node_.clipboard().startPolling();
            } else {
                node_.clipboard().stopPolling();
            }
            return Result<void, Error>::ok();

        case CommandKind::ClipSend: {
            auto sent = node_.clipboard().sendNow();
            if (sent.is_err()) {
                return Result<void, Error>::err(sent.unwrap_err());
            }
            return Result<void, Error>::ok();
        }

        case CommandKind::Quit:
            emit quitRequested();
            return Result<void, Error>::ok();
    }
    return Result<void, Error>::err(Error{ErrorKind::InvalidArgument, "unhandled command"});
}

void Console::writeEvent(const QString& name, const QJsonObject& payload) {
    QJsonObject line = payload;
    line.insert(QStringLiteral("event"), name);
    *out_ << QString::fromUtf8(QJsonDocument(line).toJson(QJsonDocument::Compact)) << '\n';
    out_->flush();
}

} // namespace lanlink::app
