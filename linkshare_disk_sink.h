// Write side of an incoming file
#pragma once

#include "linkshare_event_loop.h"
#include "linkshare_protocol.h"

#include <functional>
#include <memory>
#include <string>

namespace linkshare {

// Sequential write target for one received file. Completions arrive later on
// the loop; the owner never issues a second write before the first completes.
class DiskSink {
public:
    using Completion = std::function<void(bool ok, const std::string& err)>;

    virtual ~DiskSink() = default;

    // `data` must stay valid until `done` runs.
    virtual void write(const Bytes& data, Completion done) = 0;
    // Makes written bytes durable and releases the handle.
    virtual void close(Completion done) = 0;
    // Releases the handle and discards the partial output; no completion is delivered.
    virtual void abort() = 0;

    virtual std::string describe() const = 0;
};

// DiskSink writing to a local path (created/truncated on open, fsync'd on close).
class FileDiskSink : public DiskSink {
public:
    static std::unique_ptr<FileDiskSink> open(Scheduler& sched, const std::string& path, std::string* err = nullptr);

    ~FileDiskSink() override;

    void write(const Bytes& data, Completion done) override;
    void close(Completion done) override;
    void abort() override;
    std::string describe() const override { return path_; }

    const std::string& path() const { return path_; }

private:
    FileDiskSink(Scheduler& sched, int fd, std::string path);
    void complete_later(Completion done, bool ok, std::string err);

    Scheduler& sched_;
    int fd_;
    std::string path_;
    std::shared_ptr<bool> alive_;
};

} // namespace linkshare
