#include "linkshare_receive_sink.h"
#include "linkshare_log.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <unistd.h>

namespace linkshare {

bool persist_artifact(const std::string& path, const ReceivedArtifact& a, std::string* err) {
    std::ofstream out;
    if (a.sink_bytes > 0) {
        // the sink already holds the prefix; drop anything past the last committed write
        if (::truncate(path.c_str(), static_cast<off_t>(a.sink_bytes)) != 0) {
            if (err) *err = "truncate " + path + ": " + std::strerror(errno);
            return false;
        }
        out.open(path, std::ios::binary | std::ios::app);
    } else {
        out.open(path, std::ios::binary | std::ios::trunc);
    }
    if (!out) {
        if (err) *err = "cannot open " + path;
        return false;
    }
    if (!a.memory.empty()) out.write(reinterpret_cast<const char*>(a.memory.data()), a.memory.size());
    out.close();
    if (!out) {
        if (err) *err = "write failed for " + path;
        return false;
    }
    return true;
}

// ---- MemorySink ----

void MemorySink::append(Bytes chunk) {
    bytes_ += chunk.size();
    if (!chunk.empty()) chunks_.push_back(std::move(chunk));
}

Bytes MemorySink::take() {
    Bytes out;
    out.reserve(static_cast<std::size_t>(bytes_));
    for (auto& c : chunks_) out.insert(out.end(), c.begin(), c.end());
    chunks_.clear();
    return out;
}

void MemorySink::finish(FinishCallback done) {
    ReceivedArtifact a;
    a.memory = take();
    done(true, std::move(a), std::string());
}

void MemorySink::abort() {
    chunks_.clear();
    bytes_ = 0;
}

// ---- StreamingSink ----

StreamingSink::StreamingSink(std::unique_ptr<DiskSink> sink, std::uint64_t flush_threshold, DegradedHandler on_degraded)
    : sink_(std::move(sink)),
      threshold_(flush_threshold == 0 ? 1 : flush_threshold),
      on_degraded_(std::move(on_degraded)),
      alive_(std::make_shared<bool>(true)) {}

StreamingSink::~StreamingSink() {
    *alive_ = false;
    if (!aborted_ && sink_open_ && !closing_) sink_->abort();
}

void StreamingSink::append(Bytes chunk) {
    if (aborted_) return;
    appended_ += chunk.size();
    if (fallback_) {
        fallback_->append(std::move(chunk));
        return;
    }
    buffered_ += chunk.size();
    buffer_.push_back(std::move(chunk));
    maybe_flush();
}

void StreamingSink::maybe_flush() {
    if (aborted_ || fallback_ || in_flight_active_ || closing_) return;

    if (buffered_ >= threshold_ || (finishing_ && buffered_ > 0)) {
        in_flight_.clear();
        in_flight_.reserve(static_cast<std::size_t>(buffered_));
        for (auto& b : buffer_) in_flight_.insert(in_flight_.end(), b.begin(), b.end());
        buffer_.clear();
        buffered_ = 0;
        in_flight_active_ = true;
        ++writes_;
        log_debug("SINK") << "flush #" << writes_ << " " << in_flight_.size() << " bytes to " << sink_->describe() << std::endl;
        std::weak_ptr<bool> alive = alive_;
        sink_->write(in_flight_, [this, alive](bool ok, const std::string& err) {
            auto a = alive.lock();
            if (!a || !*a) return;
            on_write_done(ok, err);
        });
        return;
    }

    if (finishing_ && buffered_ == 0) close_sink();
}

void StreamingSink::on_write_done(bool ok, const std::string& err) {
    in_flight_active_ = false;
    if (aborted_) return;
    if (!ok) {
        degrade(err);
        return;
    }
    committed_ += in_flight_.size();
    in_flight_.clear();
    maybe_flush();
}

void StreamingSink::degrade(const std::string& err) {
    log_err("SINK") << "write to " << sink_->describe() << " failed (" << err << "), keeping the rest of "
                    << "this file in memory after " << committed_ << " committed bytes" << std::endl;
    fallback_.reset(new MemorySink);
    fallback_->append(std::move(in_flight_));
    in_flight_ = Bytes();
    for (auto& b : buffer_) fallback_->append(std::move(b));
    buffer_.clear();
    buffered_ = 0;
    if (on_degraded_) on_degraded_(err, committed_);
    close_sink();
}

void StreamingSink::close_sink() {
    if (!sink_open_ || closing_) return;
    closing_ = true;
    std::weak_ptr<bool> alive = alive_;
    sink_->close([this, alive](bool ok, const std::string& err) {
        auto a = alive.lock();
        if (!a || !*a) return;
        closing_ = false;
        sink_open_ = false;
        if (aborted_) return;
        if (!ok) {
            if (!fallback_) {
                if (finishing_) deliver(false, err);
                return;
            }
            log_err("SINK") << "close after failed write also failed: " << err << std::endl;
        }
        if (finishing_) deliver(true, std::string());
    });
}

void StreamingSink::finish(FinishCallback done) {
    if (aborted_) return;
    finishing_ = true;
    finish_cb_ = std::move(done);
    if (fallback_) {
        if (!closing_) deliver(true, std::string());
        return;
    }
    maybe_flush();
}

void StreamingSink::deliver(bool ok, const std::string& err) {
    if (!finish_cb_) return;
    FinishCallback cb = std::move(finish_cb_);
    finish_cb_ = nullptr;
    ReceivedArtifact a;
    a.sink_label = sink_->describe();
    a.sink_bytes = committed_;
    if (fallback_) {
        a.memory = fallback_->take();
        a.degraded = true;
    }
    cb(ok, std::move(a), err);
}

void StreamingSink::abort() {
    if (aborted_) return;
    aborted_ = true;
    buffer_.clear();
    buffered_ = 0;
    fallback_.reset();
    finish_cb_ = nullptr;
    if (sink_open_ && !closing_) sink_->abort();
    sink_open_ = false;
    in_flight_.clear();
}

} // namespace linkshare
