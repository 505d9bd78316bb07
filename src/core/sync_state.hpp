#pragma once

#include <QMutex>
#include <QString>

#include <atomic>
#include <cstdint>

namespace lanlink::core {

/**
 * SyncState - process-wide state shared by the transfer, clipboard and
 * storage layers. Owned by the node and injected into each manager.
 *
 * Composite values sit behind a mutex; flags and counters are atomics.
 */
class SyncState {
public:
    SyncState() = default;
    explicit SyncState(QString save_dir);

    SyncState(const SyncState&) = delete;
    SyncState& operator=(const SyncState&) = delete;

    // Save directory. Read fresh by each accepted transfer connection.
    [[nodiscard]] QString saveDir() const;
    void setSaveDir(const QString& dir);

    [[nodiscard]] uint64_t nextStreamHandle();

    void requestSendCancel();
    void clearSendCancel();
    [[nodiscard]] bool sendCancelRequested() const;

    // Receive cancel is a generation counter: a request cancels every
    // transfer that recorded an older generation, and none accepted after it.
    void requestReceiveCancel();
    [[nodiscard]] uint64_t receiveCancelGeneration() const;
    [[nodiscard]] bool receiveCancelledSince(uint64_t generation) const;

    [[nodiscard]] QString lastClipboardHash() const;
    void setLastClipboardHash(const QString& hash);

private:
    mutable QMutex mu_;
    QString save_dir_;
    QString last_clipboard_hash_;

    std::atomic<uint64_t> next_handle_{1};
    std::atomic<bool> cancel_send_{false};
    std::atomic<uint64_t> receive_cancel_generation_{0};
};

} // namespace lanlink::core
