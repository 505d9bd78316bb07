#pragma once

#include "core/result.hpp"

#include <QMetaType>
#include <QString>

#include <optional>
#include <vector>

namespace lanlink::transfer {

enum class TransferState {
    Pending,
    InProgress,
    Completed,
    Failed,
    Cancelled
};

enum class TransferDirection {
    Send,
    Receive
};

[[nodiscard]] const char* to_string(TransferState state);

[[nodiscard]] inline bool is_terminal(TransferState state) {
    return state == TransferState::Completed ||
           state == TransferState::Failed ||
           state == TransferState::Cancelled;
}

/**
 * Progress snapshot for one file. `total_bytes` is 0 when unknown.
 */
struct TransferProgress {
    QString file_name;
    quint64 bytes_transferred = 0;
    quint64 total_bytes = 0;
    double percentage = 0.0;
    TransferDirection direction = TransferDirection::Receive;
};

/**
 * TransferSession - one file's byte stream in one direction.
 *
 * Pending -> InProgress -> {Completed | Failed | Cancelled}. Terminal states
 * are final; illegal transitions are refused and leave the state unchanged.
 */
class TransferSession {
public:
    TransferSession(TransferDirection direction,
                    QString file_name,
                    std::optional<quint64> total_bytes,
                    quint32 sequence_index = 0,
                    quint32 sequence_total = 1);

    bool begin();
    bool complete();
    bool fail(Error error);
    bool cancel(ErrorKind by);

    void addBytes(quint64 count);

    [[nodiscard]] TransferState state() const { return state_; }
    [[nodiscard]] TransferDirection direction() const { return direction_; }
    [[nodiscard]] const QString& fileName() const { return file_name_; }
    [[nodiscard]] std::optional<quint64> totalBytes() const { return total_bytes_; }
    [[nodiscard]] quint64 bytesTransferred() const { return bytes_transferred_; }
    [[nodiscard]] quint32 sequenceIndex() const { return sequence_index_; }
    [[nodiscard]] quint32 sequenceTotal() const { return sequence_total_; }
    [[nodiscard]] const std::optional<Error>& error() const { return error_; }

    /**
     * True when the byte count matches the announced size, or the size is unknown.
     */
    [[nodiscard]] bool isByteCountComplete() const;

    [[nodiscard]] double percentage() const;
    [[nodiscard]] TransferProgress progress() const;

private:
    bool finish(TransferState next);

    TransferDirection direction_;
    QString file_name_;
    std::optional<quint64> total_bytes_;
    quint64 bytes_transferred_ = 0;
    quint32 sequence_index_;
    quint32 sequence_total_;
    TransferState state_ = TransferState::Pending;
    std::optional<Error> error_;
};

/**
 * Decides when a progress notification is due: after every 100 KB, after
 * every further 10 % of a known total, and once at completion.
 */
class ProgressThrottle {
public:
    static constexpr quint64 kByteInterval = 100 * 1024;
    static constexpr double kPercentInterval = 10.0;

    explicit ProgressThrottle(std::optional<quint64> total_bytes);

    [[nodiscard]] bool shouldEmit(quint64 bytes_transferred);

private:
    std::optional<quint64> total_bytes_;
    quint64 last_bytes_ = 0;
    double last_percent_ = 0.0;
    bool emitted_final_ = false;
};

/**
 * TransferQueue - ordered sessions of one multi-file send.
 *
 * At most one session is InProgress; the queue only advances past a session
 * once it reached a terminal state.
 */
class TransferQueue {
public:
    TransferQueue() = default;
    explicit TransferQueue(std::vector<TransferSession> sessions);

    [[nodiscard]] bool empty() const { return sessions_.empty(); }
    [[nodiscard]] size_t size() const { return sessions_.size(); }
    [[nodiscard]] std::optional<size_t> activeIndex() const { return active_; }
    [[nodiscard]] const std::vector<TransferSession>& sessions() const { return sessions_; }
    [[nodiscard]] TransferSession& at(size_t index) { return sessions_.at(index); }

    /**
     * Move to the next Pending session. Refused while the active one is not terminal.
     * @return the new active index, or nullopt when nothing is left
     */
    std::optional<size_t> advance();

    /**
     * Cancel every session that never started.
     */
    void abortRemaining(ErrorKind reason);

    [[nodiscard]] bool isFinished() const;
    [[nodiscard]] size_t countIn(TransferState state) const;

private:
    std::vector<TransferSession> sessions_;
    std::optional<size_t> active_;
};

} // namespace lanlink::transfer

Q_DECLARE_METATYPE(lanlink::transfer::TransferProgress)
