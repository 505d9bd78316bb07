#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QString>

#include <optional>

namespace lanlink::transfer {

/**
 * Metadata text frame that opens every file transfer connection.
 *
 * Legacy senders only send `name`; `size` is then unknown and completion is
 * judged by a clean close alone.
 */
struct FileMeta {
    QString name;
    std::optional<quint64> size;
    quint32 index = 0;
    quint32 total = 1;
    std::optional<QString> relative_path;

    /**
     * Path used for display and as the destination below the save directory:
     * the sanitized relative path when present and valid, else the bare name.
     */
    [[nodiscard]] QString destinationName() const;
};

QByteArray encode_file_meta(const FileMeta& meta);

Result<FileMeta, Error> decode_file_meta(const QByteArray& text);

/**
 * Normalize a sender-supplied relative path: '\' becomes '/', empty and '.'
 * components are dropped. Returns nullopt for '..' components, NUL bytes or
 * a path with nothing left.
 */
std::optional<QString> sanitize_relative_path(const QString& path);

/**
 * Reduce a sender-supplied file name to its last path component.
 */
QString sanitize_file_name(const QString& name);

} // namespace lanlink::transfer
