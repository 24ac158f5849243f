// Receiver storage strategies
#pragma once

#include "linkshare_disk_sink.h"
#include "linkshare_protocol.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace linkshare {

// What a finished receive produced. The file's content is the first
// `sink_bytes` written to the sink followed by `memory`.
struct ReceivedArtifact {
    std::string sink_label;      // DiskSink::describe(), empty when nothing went to a sink
    std::uint64_t sink_bytes{};
    Bytes memory;
    bool degraded{};             // a sink write failed and the tail was kept in memory

    std::uint64_t total_bytes() const { return sink_bytes + memory.size(); }
};

// Writes the artifact's full content to `path`. An existing file holding the
// sink prefix is truncated to `sink_bytes` and the memory tail appended.
bool persist_artifact(const std::string& path, const ReceivedArtifact& a, std::string* err = nullptr);

// Receiver storage strategy for one session, chosen at confirmation time.
class ReceiveSink {
public:
    using FinishCallback = std::function<void(bool ok, ReceivedArtifact artifact, const std::string& err)>;

    virtual ~ReceiveSink() = default;

    virtual void append(Bytes chunk) = 0;
    // Drains everything appended so far, then delivers the artifact exactly once.
    virtual void finish(FinishCallback done) = 0;
    // Drops all buffered data and releases resources; a pending finish never completes.
    virtual void abort() = 0;

    // True while appended bytes are headed for a disk sink
    virtual bool streaming() const = 0;
    virtual std::uint64_t bytes_appended() const = 0;
};

// Fallback strategy: keeps every chunk for the session and materializes one buffer at finish.
class MemorySink : public ReceiveSink {
public:
    void append(Bytes chunk) override;
    void finish(FinishCallback done) override;
    void abort() override;
    bool streaming() const override { return false; }
    std::uint64_t bytes_appended() const override { return bytes_; }

    Bytes take();

private:
    std::vector<Bytes> chunks_;
    std::uint64_t bytes_ = 0;
};

// Motor strategy: batches chunks into a write buffer and hands the sink one
// consolidated write whenever the buffer reaches the flush threshold.
//
// Only one write is outstanding at a time. If a write fails, the failed batch
// and everything after it go to an internal MemorySink for the rest of the
// session; bytes committed before the failure stay in the sink.
class StreamingSink : public ReceiveSink {
public:
    // Called once when a write fails, with the bytes the sink holds at that point.
    using DegradedHandler = std::function<void(const std::string& err, std::uint64_t committed)>;

    StreamingSink(std::unique_ptr<DiskSink> sink, std::uint64_t flush_threshold, DegradedHandler on_degraded = nullptr);
    ~StreamingSink() override;

    void append(Bytes chunk) override;
    void finish(FinishCallback done) override;
    void abort() override;
    bool streaming() const override { return !fallback_; }
    std::uint64_t bytes_appended() const override { return appended_; }

    std::uint64_t committed_bytes() const { return committed_; }
    std::uint64_t buffered_bytes() const { return buffered_; }
    std::uint64_t writes_issued() const { return writes_; }
    bool write_in_flight() const { return in_flight_active_; }

private:
    void maybe_flush();
    void on_write_done(bool ok, const std::string& err);
    void degrade(const std::string& err);
    void close_sink();
    void deliver(bool ok, const std::string& err);

    std::unique_ptr<DiskSink> sink_;
    std::uint64_t threshold_;
    DegradedHandler on_degraded_;

    std::vector<Bytes> buffer_;
    std::uint64_t buffered_ = 0;
    Bytes in_flight_;
    bool in_flight_active_ = false;

    std::uint64_t appended_ = 0;
    std::uint64_t committed_ = 0;
    std::uint64_t writes_ = 0;

    std::unique_ptr<MemorySink> fallback_;
    bool sink_open_ = true;
    bool closing_ = false;
    bool finishing_ = false;
    bool aborted_ = false;
    FinishCallback finish_cb_;
    std::shared_ptr<bool> alive_;
};

} // namespace linkshare
