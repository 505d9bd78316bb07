#pragma once

#include <QString>
#include <QStringList>

#include "core/result.hpp"

namespace lanlink::app {

enum class CommandKind {
    Devices,
    Send,
    SendFolder,
    CancelSend,
    CancelReceive,
    SaveDir,
    Chat,
    Say,
    ChatClose,
    ChatCloseAll,
    ClipConnect,
    ClipDisconnect,
    ClipPoll,
    ClipSend,
    Quit,
};

struct Command {
    CommandKind kind = CommandKind::Devices;
    QStringList args;
};

/**
 * Parse one line typed on stdin. Arguments are split shell-style so paths
 * may be quoted; `say` keeps the rest of the line verbatim.
 */
[[nodiscard]] Result<Command> parse_command(const QString& line);

[[nodiscard]] QString usage_text();

} // namespace lanlink::app
