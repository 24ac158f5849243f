#include "linkshare_queue.h"
#include "linkshare_log.h"

namespace linkshare {

const char* to_string(QueueState s) {
    switch (s) {
        case QueueState::Idle:     return "idle";
        case QueueState::Running:  return "running";
        case QueueState::Terminal: return "terminal";
    }
    return "unknown";
}

QueueCoordinator::QueueCoordinator(SenderEngine& sender, const Config& cfg)
    : sender_(sender), handshake_retries_(cfg.handshake_retries) {
    sender_.set_finished_handler([this](const TransferResult& r) { on_sender_finished(r); });
}

void QueueCoordinator::enqueue(std::unique_ptr<ByteSource> source) {
    if (!source) return;
    log_out("QUEUE") << "Queued " << source->name() << " (" << format_mb(source->size()) << ")" << std::endl;
    pending_.push_back(std::move(source));
    if (state_ == QueueState::Terminal) start();
}

bool QueueCoordinator::start() {
    if (state_ == QueueState::Running || pending_.empty()) return false;
    if (state_ == QueueState::Terminal) results_.clear();
    state_ = QueueState::Running;
    advance();
    return true;
}

void QueueCoordinator::advance() {
    while (!pending_.empty()) {
        current_ = std::move(pending_.front());
        pending_.pop_front();
        attempts_ = 0;
        if (sender_.announce(*current_)) return;

        TransferResult r;
        r.descriptor = current_->descriptor();
        r.direction = TransferDirection::Send;
        r.status = TransferStatus::Failed;
        r.error = TransferError::ChannelClosed;
        record(std::move(r));
    }
    current_.reset();
    state_ = QueueState::Terminal;
    log_out("QUEUE") << "Queue drained, " << results_.size() << " file(s) processed" << std::endl;
    if (drained_) drained_(results_);
}

void QueueCoordinator::on_sender_finished(TransferResult r) {
    if (state_ != QueueState::Running || !current_) {
        log_debug("QUEUE") << "sender finished " << r.descriptor.name << " outside the queue" << std::endl;
        return;
    }
    if (r.error == TransferError::HandshakeTimeout) {
        if (attempts_ < handshake_retries_) {
            ++attempts_;
            log_out("QUEUE") << "Retrying " << current_->name() << " (attempt " << attempts_ + 1 << ")" << std::endl;
            if (sender_.announce(*current_)) return;
        } else {
            log_err("QUEUE") << "Skipping " << current_->name() << ", peer never became ready" << std::endl;
            r.status = TransferStatus::Skipped;
        }
    }
    record(std::move(r));
    current_.reset();
    advance();
}

void QueueCoordinator::record(TransferResult r) {
    results_.push_back(std::move(r));
    if (result_) result_(results_.back());
}

void QueueCoordinator::cancel_all(const std::string& reason) {
    if (!pending_.empty()) log_out("QUEUE") << "Dropping " << pending_.size() << " queued file(s)" << std::endl;
    pending_.clear();
    if (!sender_.cancel(reason) && state_ == QueueState::Running && current_) {
        // between the ack and the settle timer; let the finished callback drain the queue
        log_debug("QUEUE") << "cancel while " << current_->name() << " is settling" << std::endl;
    }
}

} // namespace linkshare
