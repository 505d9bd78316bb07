#include "transfer/file_meta.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace lanlink::transfer {

QString FileMeta::destinationName() const {
    if (relative_path) {
        if (auto cleaned = sanitize_relative_path(*relative_path)) {
            return *cleaned;
        }
    }
    return sanitize_file_name(name);
}

QByteArray encode_file_meta(const FileMeta& meta) {
    QJsonObject obj;
    obj["name"] = meta.name;
    if (meta.size) {
        obj["size"] = static_cast<qint64>(*meta.size);
    }
    obj["index"] = static_cast<qint64>(meta.index);
    obj["total"] = static_cast<qint64>(meta.total);
    if (meta.relative_path) {
        obj["relative_path"] = *meta.relative_path;
    }
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Result<FileMeta, Error> decode_file_meta(const QByteArray& text) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(text, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return Result<FileMeta, Error>::err(Error{ErrorKind::ProtocolParseError, "invalid json"});
    }

    const auto obj = doc.object();
    if (!obj.value("name").isString()) {
        return Result<FileMeta, Error>::err(Error{ErrorKind::ProtocolParseError, "missing name"});
    }

    FileMeta meta;
    meta.name = obj.value("name").toString();
    if (sanitize_file_name(meta.name).isEmpty()) {
        return Result<FileMeta, Error>::err(Error{ErrorKind::ProtocolParseError, "empty name"});
    }

    const auto size = obj.value("size");
    if (size.isDouble()) {
        if (size.toDouble() < 0) {
            return Result<FileMeta, Error>::err(Error{ErrorKind::ProtocolParseError, "negative size"});
        }
        meta.size = static_cast<quint64>(size.toInteger());
    } else if (!size.isUndefined() && !size.isNull()) {
        return Result<FileMeta, Error>::err(Error{ErrorKind::ProtocolParseError, "invalid size"});
    }

    const auto index = obj.value("index").toInteger(0);
    const auto total = obj.value("total").toInteger(0);
    meta.index = index > 0 ? static_cast<quint32>(index) : 0;
    meta.total = total > 0 ? static_cast<quint32>(total) : 1;

    const auto relative = obj.value("relative_path");
    if (relative.isString() && !relative.toString().isEmpty()) {
        meta.relative_path = relative.toString();
    }
    return Result<FileMeta, Error>::ok(std::move(meta));
}

std::optional<QString> sanitize_relative_path(const QString& path) {
    if (path.isEmpty()) {
        return std::nullopt;
    }

    QString normalized = path;
    normalized.replace(QLatin1Char('\\'), QLatin1Char('/'));

    QStringList components;
    for (const QString& component : normalized.split(QLatin1Char('/'))) {
        if (component.isEmpty() || component == QLatin1String(".")) {
            continue;
        }
        if (component == QLatin1String("..") || component.contains(QChar(u'\0'))) {
            return std::nullopt;
        }
        components.append(component);
    }

    if (components.isEmpty()) {
        return std::nullopt;
    }
    return components.join(QLatin1Char('/'));
}

QString sanitize_file_name(const QString& name) {
    QString normalized = name;
    normalized.replace(QLatin1Char('\\'), QLatin1Char('/'));
    normalized.remove(QChar(u'\0'));
    QString last = normalized.section(QLatin1Char('/'), -1);
    if (last == QLatin1String(".") || last == QLatin1String("..")) {
        return QString();
    }
    return last;
}

} // namespace lanlink::transfer
