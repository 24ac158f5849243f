// Read side of an outgoing file
#pragma once

#include "linkshare_event_loop.h"
#include "linkshare_protocol.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace linkshare {

// Read-only view of one local file. read() may complete later on the loop;
// callers keep at most one read outstanding.
class ByteSource {
public:
    using ReadCallback = std::function<void(bool ok, Bytes data)>;

    virtual ~ByteSource() = default;

    virtual const std::string& name() const = 0;
    virtual std::uint64_t size() const = 0;
    virtual const std::string& media_type() const = 0;

    // Delivers up to `length` bytes starting at `offset`; fewer only at end of file.
    virtual void read(std::uint64_t offset, std::size_t length, ReadCallback cb) = 0;

    FileDescriptor descriptor() const { return FileDescriptor{name(), size(), media_type()}; }
};

// ByteSource over a regular file, read with pread() and completed on the next loop turn.
class FileByteSource : public ByteSource {
public:
    // Returns nullptr (with `err` set) when the path is not a readable regular file.
    static std::unique_ptr<FileByteSource> open(Scheduler& sched, const std::string& path, std::string* err = nullptr);

    ~FileByteSource() override;

    const std::string& name() const override { return name_; }
    std::uint64_t size() const override { return size_; }
    const std::string& media_type() const override { return media_type_; }
    const std::string& path() const { return path_; }

    void read(std::uint64_t offset, std::size_t length, ReadCallback cb) override;

private:
    FileByteSource(Scheduler& sched, int fd, std::string path, std::uint64_t size);

    Scheduler& sched_;
    int fd_;
    std::string path_;
    std::string name_;
    std::string media_type_;
    std::uint64_t size_;
    // posted completions check this before touching the source
    std::shared_ptr<bool> alive_;
};

} // namespace linkshare
