#pragma once

#include "storage/storage_backend.hpp"

#include <QFile>
#include <QMutex>

#include <map>
#include <memory>

namespace lanlink::core { class SyncState; }

namespace lanlink::storage {

/**
 * LocalFileStorage - StorageBackend over the local file system (QFile).
 */
class LocalFileStorage final : public StorageBackend {
public:
    explicit LocalFileStorage(std::shared_ptr<core::SyncState> state);
    ~LocalFileStorage() override;

    Result<WriteTarget, Error> open_write_stream(const QString& dir,
                                                 const QString& relative_name) override;
    Result<void, Error> write(StreamHandle handle, const QByteArray& bytes) override;
    Result<void, Error> close(StreamHandle handle) override;
    Result<void, Error> remove(StreamHandle handle) override;
    void release(StreamHandle handle) override;

    Result<SourceInfo, Error> describe(const QString& location) override;
    Result<std::vector<SourceInfo>, Error> list_folder(const QString& dir) override;
    Result<StreamHandle, Error> open_read_stream(const QString& location) override;
    Result<QByteArray, Error> read_chunk(StreamHandle handle, qint64 offset, qint64 size) override;

    [[nodiscard]] size_t openStreamCount() const;
    [[nodiscard]] size_t closedStreamCount() const;

private:
    struct Stream {
        std::unique_ptr<QFile> file;
        bool writable = false;
    };

    std::shared_ptr<core::SyncState> state_;
    mutable QMutex mu_;
    std::map<StreamHandle, Stream> streams_;
    // Closed write streams not yet released, so remove() still works after close().
    std::map<StreamHandle, QString> closed_;
};

} // namespace lanlink::storage
