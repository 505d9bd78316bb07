#include "transfer/transfer_session.hpp"

#include <algorithm>

namespace lanlink::transfer {

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::Pending: return "pending";
        case TransferState::InProgress: return "in_progress";
        case TransferState::Completed: return "completed";
        case TransferState::Failed: return "failed";
        case TransferState::Cancelled: return "cancelled";
    }
    return "unknown";
}

// TransferSession

TransferSession::TransferSession(TransferDirection direction,
                                 QString file_name,
                                 std::optional<quint64> total_bytes,
                                 quint32 sequence_index,
                                 quint32 sequence_total)
    : direction_(direction)
    , file_name_(std::move(file_name))
    , total_bytes_(total_bytes)
    , sequence_index_(sequence_index)
    , sequence_total_(sequence_total == 0 ? 1 : sequence_total)
{}

bool TransferSession::begin() {
    if (state_ != TransferState::Pending) {
        return false;
    }
    state_ = TransferState::InProgress;
    return true;
}

bool TransferSession::finish(TransferState next) {
    // A session that never started may still be cancelled or failed, never completed.
    if (is_terminal(state_)) {
        return false;
    }
    if (next == TransferState::Completed && state_ != TransferState::InProgress) {
        return false;
    }
    state_ = next;
    return true;
}

bool TransferSession::complete() {
    return finish(TransferState::Completed);
}

bool TransferSession::fail(Error error) {
    if (!finish(TransferState::Failed)) {
        return false;
    }
    error_ = std::move(error);
    return true;
}

bool TransferSession::cancel(ErrorKind by) {
    if (!finish(TransferState::Cancelled)) {
        return false;
    }
    error_ = Error{by, by == ErrorKind::CancelledByRemote ? "Cancelled by receiver" : "Cancelled"};
    return true;
}

void TransferSession::addBytes(quint64 count) {
    if (state_ == TransferState::InProgress) {
        bytes_transferred_ += count;
    }
}

bool TransferSession::isByteCountComplete() const {
    return !total_bytes_ || bytes_transferred_ >= *total_bytes_;
}

double TransferSession::percentage() const {
    if (!total_bytes_ || *total_bytes_ == 0) {
        return state_ == TransferState::Completed ? 100.0 : 0.0;
    }
    const double pct = static_cast<double>(bytes_transferred_) * 100.0 /
                       static_cast<double>(*total_bytes_);
    return std::min(pct, 100.0);
}

TransferProgress TransferSession::progress() const {
    return TransferProgress{file_name_, bytes_transferred_, total_bytes_.value_or(0),
                            percentage(), direction_};
}

// ProgressThrottle

ProgressThrottle::ProgressThrottle(std::optional<quint64> total_bytes)
    : total_bytes_(total_bytes) {}

bool ProgressThrottle::shouldEmit(quint64 bytes_transferred) {
    if (total_bytes_ && bytes_transferred >= *total_bytes_) {
        if (emitted_final_) {
            return false;
        }
        emitted_final_ = true;
        last_bytes_ = bytes_transferred;
        last_percent_ = 100.0;
        return true;
    }

    bool due = bytes_transferred - last_bytes_ >= kByteInterval;
    double percent = 0.0;
    if (total_bytes_ && *total_bytes_ > 0) {
        percent = static_cast<double>(bytes_transferred) * 100.0 / static_cast<double>(*total_bytes_);
        due = due || percent - last_percent_ >= kPercentInterval;
    }

    if (due) {
        last_bytes_ = bytes_transferred;
        last_percent_ = percent;
    }
    return due;
}

// TransferQueue

TransferQueue::TransferQueue(std::vector<TransferSession> sessions)
    : sessions_(std::move(sessions)) {}

std::optional<size_t> TransferQueue::advance() {
    if (active_ && !is_terminal(sessions_.at(*active_).state())) {
        return std::nullopt;
    }

    const size_t start = active_ ? *active_ + 1 : 0;
    for (size_t i = start; i < sessions_.size(); ++i) {
        if (sessions_[i].state() == TransferState::Pending) {
            active_ = i;
            return active_;
        }
    }
    return std::nullopt;
}

void TransferQueue::abortRemaining(ErrorKind reason) {
    for (auto& session : sessions_) {
        if (session.state() == TransferState::Pending) {
            session.cancel(reason);
        }
    }
}

bool TransferQueue::isFinished() const {
    return std::all_of(sessions_.begin(), sessions_.end(), [](const TransferSession& s) {
        return is_terminal(s.state());
    });
}

size_t TransferQueue::countIn(TransferState state) const {
    return static_cast<size_t>(std::count_if(sessions_.begin(), sessions_.end(),
                                             [state](const TransferSession& s) {
        return s.state() == state;
    }));
}

} // namespace lanlink::transfer
