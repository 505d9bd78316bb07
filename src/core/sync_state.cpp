#include "core/sync_state.hpp"

#include <QMutexLocker>

namespace lanlink::core {

SyncState::SyncState(QString save_dir)
    : save_dir_(std::move(save_dir)) {}

QString SyncState::saveDir() const {
    QMutexLocker lock(&mu_);
    return save_dir_;
}

void SyncState::setSaveDir(const QString& dir) {
    QMutexLocker lock(&mu_);
    save_dir_ = dir;
}

uint64_t SyncState::nextStreamHandle() {
    return next_handle_.fetch_add(1, std::memory_order_relaxed);
}

void SyncState::requestSendCancel() {
    cancel_send_.store(true);
}

void SyncState::clearSendCancel() {
    cancel_send_.store(false);
}

bool SyncState::sendCancelRequested() const {
    return cancel_send_.load();
}

void SyncState::requestReceiveCancel() {
    receive_cancel_generation_.fetch_add(1);
}

uint64_t SyncState::receiveCancelGeneration() const {
    return receive_cancel_generation_.load();
}

bool SyncState::receiveCancelledSince(uint64_t generation) const {
    return receive_cancel_generation_.load() != generation;
}

QString SyncState::lastClipboardHash() const {
    QMutexLocker lock(&mu_);
    return last_clipboard_hash_;
}

void SyncState::setLastClipboardHash(const QString& hash) {
    QMutexLocker lock(&mu_);
    last_clipboard_hash_ = hash;
}

} // namespace lanlink::core
