#include "app/cli/commands.hpp"

#include <QProcess>

#include <array>

namespace lanlink::app {

namespace {

struct CommandEntry {
    const char* name;
    CommandKind kind;
    int min_args;
    int max_args; // -1: unbounded
    const char* usage;
};

constexpr std::array<CommandEntry, 15> kCommands{{
    {"devices", CommandKind::Devices, 0, 0, "devices"},
    {"send", CommandKind::Send, 2, -1, "send <ip> <path>..."},
    {"send-folder", CommandKind::SendFolder, 2, 2, "send-folder <ip> <dir>"},
    {"cancel-send", CommandKind::CancelSend, 0, 0, "cancel-send"},
    {"cancel-receive", CommandKind::CancelReceive, 0, 0, "cancel-receive"},
    {"save-dir", CommandKind::SaveDir, 1, 1, "save-dir <dir>"},
    {"chat", CommandKind::Chat, 1, 1, "chat <ip>"},
    {"say", CommandKind::Say, 1, 1, "say <text>"},
    {"chat-close", CommandKind::ChatClose, 0, 0, "chat-close"},
    {"chat-close-all", CommandKind::ChatCloseAll, 0, 0, "chat-close-all"},
    {"clip-connect", CommandKind::ClipConnect, 1, 1, "clip-connect <ip>"},
    {"clip-disconnect", CommandKind::ClipDisconnect, 1, 1, "clip-disconnect <ip>"},
    {"clip-poll", CommandKind::ClipPoll, 1, 1, "clip-poll on|off"},
    {"clip-send", CommandKind::ClipSend, 0, 0, "clip-send"},
    {"quit", CommandKind::Quit, 0, 0, "quit"},
}};

const CommandEntry* find_entry(const QString& name) {
    for (const auto& entry : kCommands) {
        if (name == QLatin1String(entry.name)) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace

Result<Command> parse_command(const QString& line) {
    const auto trimmed = line.trimmed();
    if (trimmed.isEmpty()) {
        return Result<Command>::err(Error{ErrorKind::InvalidArgument, "empty command"});
    }

    const auto head_end = trimmed.indexOf(QLatin1Char(' '));
    const auto name = head_end < 0 ? trimmed : trimmed.left(head_end);
    const auto rest = head_end < 0 ? QString() : trimmed.mid(head_end + 1).trimmed();

    const auto* entry = find_entry(name);
    if (entry == nullptr) {
        return Result<Command>::err(
            Error{ErrorKind::InvalidArgument, QStringLiteral("unknown command '%1'").arg(name)});
    }

    Command command{.kind = entry->kind, .args = {}};
    if (entry->kind == CommandKind::Say) {
        if (!rest.isEmpty()) {
            command.args.append(rest);
        }
    } else {
        command.args = QProcess::splitCommand(rest);
    }

    const auto count = static_cast<int>(command.args.size());
    if (count < entry->min_args || (entry->max_args >= 0 && count > entry->max_args)) {
        return Result<Command>::err(
            Error{ErrorKind::InvalidArgument, QStringLiteral("usage: %1").arg(QLatin1String(entry->usage))});
    }

    if (entry->kind == CommandKind::ClipPoll) {
        const auto& mode = command.args.first();
        if (mode != QLatin1String("on") && mode != QLatin1String("off")) {
            return Result<Command>::err(
                Error{ErrorKind::InvalidArgument, QStringLiteral("usage: %1").arg(QLatin1String(entry->usage))});
        }
    }

    return Result<Command>::ok(std::move(command));
}

QString usage_text() {
    QStringList lines;
    for (const auto& entry : kCommands) {
        lines.append(QLatin1String(entry.usage));
    }
    return lines.join(QLatin1Char('\n'));
}

} // namespace lanlink::app
