#include "network/messages.hpp"

#include <QJsonDocument>
#include <QJsonObject>

#include <optional>

namespace lanlink::network {

namespace {

QString to_text(const QJsonObject& obj) {
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

std::optional<QJsonObject> parse_object(const QString& text) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(text.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }
    return doc.object();
}

bool has_string(const QJsonObject& obj, const char* key) {
    return obj.value(QLatin1String(key)).isString();
}

} // namespace

QString encode_chat_message(const ChatMessage& message) {
    QJsonObject obj;
    obj["content"] = message.content;
    obj["from_ip"] = message.from_ip;
    obj["timestamp"] = message.timestamp;
    return to_text(obj);
}

Result<ChatMessage, Error> decode_chat_message(const QString& text) {
    const auto obj = parse_object(text);
    if (!obj) {
        return Result<ChatMessage, Error>::err(Error{ErrorKind::ProtocolParseError, "invalid json"});
    }
    if (!has_string(*obj, "content") || !has_string(*obj, "from_ip") ||
        !obj->value("timestamp").isDouble()) {
        return Result<ChatMessage, Error>::err(Error{ErrorKind::ProtocolParseError, "missing fields"});
    }

    ChatMessage message;
    message.content = obj->value("content").toString();
    message.from_ip = obj->value("from_ip").toString();
    message.timestamp = obj->value("timestamp").toInteger();
    return Result<ChatMessage, Error>::ok(std::move(message));
}

QString encode_clipboard_message(const ClipboardMessage& message) {
    QJsonObject obj;
    obj["content"] = message.content;
    obj["from_ip"] = message.from_ip;
    obj["timestamp"] = message.timestamp;
    obj["hash"] = message.hash;
    return to_text(obj);
}

Result<ClipboardMessage, Error> decode_clipboard_message(const QString& text) {
    const auto obj = parse_object(text);
    if (!obj) {
        return Result<ClipboardMessage, Error>::err(
            Error{ErrorKind::ProtocolParseError, "invalid json"});
    }
    if (!has_string(*obj, "content") || !has_string(*obj, "from_ip") ||
        !obj->value("timestamp").isDouble() || !has_string(*obj, "hash")) {
        return Result<ClipboardMessage, Error>::err(
            Error{ErrorKind::ProtocolParseError, "missing fields"});
    }

    ClipboardMessage message;
    message.content = obj->value("content").toString();
    message.from_ip = obj->value("from_ip").toString();
    message.timestamp = obj->value("timestamp").toInteger();
    message.hash = obj->value("hash").toString();
    return Result<ClipboardMessage, Error>::ok(std::move(message));
}

} // namespace lanlink::network
