#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QMetaType>
#include <QString>

namespace lanlink::network {

/**
 * One chat line. `timestamp` is milliseconds since the Unix epoch.
 */
struct ChatMessage {
    QString content;
    QString from_ip;
    qint64 timestamp = 0;

    bool operator==(const ChatMessage&) const = default;
};

/**
 * Clipboard text pushed to peers. `hash` only suppresses echo.
 */
struct ClipboardMessage {
    QString content;
    QString from_ip;
    qint64 timestamp = 0;
    QString hash;

    bool operator==(const ClipboardMessage&) const = default;
};

QString encode_chat_message(const ChatMessage& message);
Result<ChatMessage, Error> decode_chat_message(const QString& text);

QString encode_clipboard_message(const ClipboardMessage& message);
Result<ClipboardMessage, Error> decode_clipboard_message(const QString& text);

} // namespace lanlink::network

Q_DECLARE_METATYPE(lanlink::network::ChatMessage)
Q_DECLARE_METATYPE(lanlink::network::ClipboardMessage)
