#include "linkshare_byte_source.h"
#include "linkshare_log.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace linkshare {

std::unique_ptr<FileByteSource> FileByteSource::open(Scheduler& sched, const std::string& path, std::string* err) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (err) *err = "cannot open " + path + ": " + std::strerror(errno);
        return nullptr;
    }
    struct stat st{};
    if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        if (err) *err = path + " is not a regular file";
        ::close(fd);
        return nullptr;
    }
    return std::unique_ptr<FileByteSource>(
        new FileByteSource(sched, fd, path, static_cast<std::uint64_t>(st.st_size)));
}

FileByteSource::FileByteSource(Scheduler& sched, int fd, std::string path, std::uint64_t size)
    : sched_(sched), fd_(fd), path_(std::move(path)), size_(size), alive_(std::make_shared<bool>(true)) {
    name_ = basename_only(path_);
    media_type_ = guess_media_type(name_);
}

FileByteSource::~FileByteSource() {
    *alive_ = false;
    if (fd_ != -1) ::close(fd_);
}

void FileByteSource::read(std::uint64_t offset, std::size_t length, ReadCallback cb) {
    Bytes buf;
    bool ok = true;
    if (offset < size_) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(length, size_ - offset));
        buf.resize(want);
        std::size_t got = 0;
        while (got < want) {
            ssize_t n = ::pread(fd_, buf.data() + got, want - got, static_cast<off_t>(offset + got));
            if (n < 0) {
                if (errno == EINTR) continue;
                log_err("SOURCE") << "pread " << path_ << " @" << offset << ": " << std::strerror(errno) << std::endl;
                ok = false;
                break;
            }
            if (n == 0) break; // file shrank underneath us
            got += static_cast<std::size_t>(n);
        }
        buf.resize(got);
        if (got < want) ok = false;
    }
    std::weak_ptr<bool> alive = alive_;
    sched_.post([alive, ok, cb = std::move(cb), data = std::move(buf)]() mutable {
        auto a = alive.lock();
        if (!a || !*a) return;
        cb(ok, std::move(data));
    });
}

} // namespace linkshare
