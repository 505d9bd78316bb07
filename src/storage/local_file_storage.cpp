#include "storage/local_file_storage.hpp"

#include "core/sync_state.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QMutexLocker>

#include <algorithm>

namespace lanlink::storage {

namespace {

Error unknown_handle(StreamHandle handle) {
    return Error{ErrorKind::InvalidArgument,
                 "unknown stream handle " + std::to_string(handle)};
}

} // namespace

LocalFileStorage::LocalFileStorage(std::shared_ptr<core::SyncState> state)
    : state_(std::move(state)) {}

LocalFileStorage::~LocalFileStorage() {
    QMutexLocker lock(&mu_);
    for (auto& [handle, stream] : streams_) {
        stream.file->close();
    }
}

Result<WriteTarget, Error> LocalFileStorage::open_write_stream(const QString& dir,
                                                               const QString& relative_name) {
    if (relative_name.isEmpty()) {
        return Result<WriteTarget, Error>::err(
            Error{ErrorKind::InvalidArgument, "empty file name"});
    }

    const QString path = QDir(dir).filePath(relative_name);
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        return Result<WriteTarget, Error>::err(
            Error{ErrorKind::StorageWriteFailure,
                  QStringLiteral("cannot create directory %1").arg(info.absolutePath())});
    }

    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return Result<WriteTarget, Error>::err(
            Error{ErrorKind::StorageWriteFailure,
                  QStringLiteral("cannot open %1: %2").arg(path, file->errorString())});
    }

    const StreamHandle handle = state_->nextStreamHandle();
    QMutexLocker lock(&mu_);
    streams_.emplace(handle, Stream{std::move(file), true});
    return Result<WriteTarget, Error>::ok(WriteTarget{handle, path});
}

Result<void, Error> LocalFileStorage::write(StreamHandle handle, const QByteArray& bytes) {
    QMutexLocker lock(&mu_);
    auto it = streams_.find(handle);
    if (it == streams_.end() || !it->second.writable) {
        return Result<void, Error>::err(unknown_handle(handle));
    }

    auto& file = *it->second.file;
    if (file.write(bytes) != bytes.size()) {
        return Result<void, Error>::err(
            Error{ErrorKind::StorageWriteFailure,
                  QStringLiteral("write to %1 failed: %2").arg(file.fileName(), file.errorString())});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> LocalFileStorage::close(StreamHandle handle) {
    QMutexLocker lock(&mu_);
    auto it = streams_.find(handle);
    if (it == streams_.end()) {
        return Result<void, Error>::err(unknown_handle(handle));
    }

    auto& file = *it->second.file;
    const bool writable = it->second.writable;
    bool flushed = true;
    if (writable) {
        flushed = file.flush();
    }
    file.close();
    if (writable) {
        closed_.emplace(handle, file.fileName());
    }
    streams_.erase(it);

    if (!flushed) {
        return Result<void, Error>::err(
            Error{ErrorKind::StorageWriteFailure, "flush failed"});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> LocalFileStorage::remove(StreamHandle handle) {
    QString path;
    {
        QMutexLocker lock(&mu_);
        if (auto it = streams_.find(handle); it != streams_.end()) {
            if (!it->second.writable) {
                return Result<void, Error>::err(
                    Error{ErrorKind::InvalidArgument, "cannot remove a read stream"});
            }
            path = it->second.file->fileName();
            it->second.file->close();
            streams_.erase(it);
        } else if (auto closed = closed_.find(handle); closed != closed_.end()) {
            path = closed->second;
            closed_.erase(closed);
        } else {
            return Result<void, Error>::err(unknown_handle(handle));
        }
    }

    if (QFile::exists(path) && !QFile::remove(path)) {
        return Result<void, Error>::err(
            Error{ErrorKind::StorageWriteFailure, QStringLiteral("cannot delete %1").arg(path)});
    }
    return Result<void, Error>::ok();
}

void LocalFileStorage::release(StreamHandle handle) {
    QMutexLocker lock(&mu_);
    closed_.erase(handle);
}

Result<SourceInfo, Error> LocalFileStorage::describe(const QString& location) {
    const QFileInfo info(location);
    if (!info.exists() || !info.isFile()) {
        return Result<SourceInfo, Error>::err(
            Error{ErrorKind::InvalidArgument, QStringLiteral("not a file: %1").arg(location)});
    }

    SourceInfo source;
    source.location = info.absoluteFilePath();
    source.name = info.fileName();
    source.size = static_cast<quint64>(info.size());
    return Result<SourceInfo, Error>::ok(std::move(source));
}

Result<std::vector<SourceInfo>, Error> LocalFileStorage::list_folder(const QString& dir) {
    const QFileInfo root_info(dir);
    if (!root_info.exists() || !root_info.isDir()) {
        return Result<std::vector<SourceInfo>, Error>::err(
            Error{ErrorKind::InvalidArgument, QStringLiteral("not a folder: %1").arg(dir)});
    }

    const QDir root(root_info.absoluteFilePath());
    const QString root_name = root_info.fileName().isEmpty() ? QStringLiteral("folder")
                                                             : root_info.fileName();

    std::vector<SourceInfo> files;
    QDirIterator it(root.absolutePath(), QDir::Files | QDir::NoDotAndDotDot | QDir::Hidden,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QFileInfo info(it.next());
        SourceInfo source;
        source.location = info.absoluteFilePath();
        source.name = info.fileName();
        source.size = static_cast<quint64>(info.size());
        source.relative_path = root_name + QLatin1Char('/') + root.relativeFilePath(info.absoluteFilePath());
        files.push_back(std::move(source));
    }

    std::sort(files.begin(), files.end(), [](const SourceInfo& a, const SourceInfo& b) {
        return *a.relative_path < *b.relative_path;
    });
    return Result<std::vector<SourceInfo>, Error>::ok(std::move(files));
}

Result<StreamHandle, Error> LocalFileStorage::open_read_stream(const QString& location) {
    auto file = std::make_unique<QFile>(location);
    if (!file->open(QIODevice::ReadOnly)) {
        return Result<StreamHandle, Error>::err(
            Error{ErrorKind::StorageReadFailure,
                  QStringLiteral("cannot open %1: %2").arg(location, file->errorString())});
    }

    const StreamHandle handle = state_->nextStreamHandle();
    QMutexLocker lock(&mu_);
    streams_.emplace(handle, Stream{std::move(file), false});
    return Result<StreamHandle, Error>::ok(handle);
}

Result<QByteArray, Error> LocalFileStorage::read_chunk(StreamHandle handle,
                                                       qint64 offset,
                                                       qint64 size) {
    QMutexLocker lock(&mu_);
    auto it = streams_.find(handle);
    if (it == streams_.end() || it->second.writable) {
        return Result<QByteArray, Error>::err(unknown_handle(handle));
    }

    auto& file = *it->second.file;
    if (file.pos() != offset && !file.seek(offset)) {
        return Result<QByteArray, Error>::err(
            Error{ErrorKind::StorageReadFailure, QStringLiteral("seek failed in %1").arg(file.fileName())});
    }

    QByteArray chunk = file.read(size);
    if (chunk.isEmpty() && file.error() != QFileDevice::NoError) {
        return Result<QByteArray, Error>::err(
            Error{ErrorKind::StorageReadFailure,
                  QStringLiteral("read from %1 failed: %2").arg(file.fileName(), file.errorString())});
    }
    return Result<QByteArray, Error>::ok(std::move(chunk));
}

size_t LocalFileStorage::openStreamCount() const {
    QMutexLocker lock(&mu_);
    return streams_.size();
}

size_t LocalFileStorage::closedStreamCount() const {
    QMutexLocker lock(&mu_);
    return closed_.size();
}

} // namespace lanlink::storage
