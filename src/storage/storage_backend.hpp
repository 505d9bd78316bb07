#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace lanlink::storage {

using StreamHandle = uint64_t;

/**
 * An opened destination file.
 */
struct WriteTarget {
    StreamHandle handle = 0;
    QString location;
};

/**
 * A readable source file.
 */
struct SourceInfo {
    QString location;
    QString name;
    quint64 size = 0;
    // Set for files found under a folder: "<folder>/<sub>/<file>".
    std::optional<QString> relative_path;
};

/**
 * StorageBackend - byte-stream boundary between the transfer core and the
 * platform's file storage.
 *
 * Handles are opaque and never reused. The transfer core always calls
 * close() on completed writes and remove() on incomplete or cancelled ones.
 * A closed write stream stays removable until release() is called for it.
 */
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    /**
     * Create (or truncate) `relative_name` inside `dir` for writing.
     * Missing parent directories are created.
     */
    virtual Result<WriteTarget, Error> open_write_stream(const QString& dir,
                                                         const QString& relative_name) = 0;

    virtual Result<void, Error> write(StreamHandle handle, const QByteArray& bytes) = 0;

    /**
     * Flush and close a write stream, or release a read stream.
     */
    virtual Result<void, Error> close(StreamHandle handle) = 0;

    /**
     * Close the stream if still open and delete what it wrote.
     */
    virtual Result<void, Error> remove(StreamHandle handle) = 0;

    /**
     * Forget a closed write stream once its file is final. The file is kept.
     */
    virtual void release(StreamHandle handle) = 0;

    virtual Result<SourceInfo, Error> describe(const QString& location) = 0;

    /**
     * Every regular file below `dir`, with relative paths rooted at the
     * folder's own name. Sorted for a stable send order.
     */
    virtual Result<std::vector<SourceInfo>, Error> list_folder(const QString& dir) = 0;

    virtual Result<StreamHandle, Error> open_read_stream(const QString& location) = 0;

    /**
     * Read up to `size` bytes at `offset`. An empty result means end of file.
     */
    virtual Result<QByteArray, Error> read_chunk(StreamHandle handle,
                                                 qint64 offset,
                                                 qint64 size) = 0;
};

} // namespace lanlink::storage
