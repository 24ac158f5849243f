#include "linkshare_disk_sink.h"
#include "linkshare_log.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace linkshare {

std::unique_ptr<FileDiskSink> FileDiskSink::open(Scheduler& sched, const std::string& path, std::string* err) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (err) *err = "cannot create " + path + ": " + std::strerror(errno);
        return nullptr;
    }
    return std::unique_ptr<FileDiskSink>(new FileDiskSink(sched, fd, path));
}

FileDiskSink::FileDiskSink(Scheduler& sched, int fd, std::string path)
    : sched_(sched), fd_(fd), path_(std::move(path)), alive_(std::make_shared<bool>(true)) {}

FileDiskSink::~FileDiskSink() {
    *alive_ = false;
    if (fd_ != -1) ::close(fd_);
}

void FileDiskSink::complete_later(Completion done, bool ok, std::string err) {
    std::weak_ptr<bool> alive = alive_;
    sched_.post([alive, done = std::move(done), ok, err = std::move(err)] {
        auto a = alive.lock();
        if (!a || !*a) return;
        done(ok, err);
    });
}

void FileDiskSink::write(const Bytes& data, Completion done) {
    if (fd_ == -1) {
        complete_later(std::move(done), false, "sink already closed");
        return;
    }
    const std::uint8_t* p = data.data();
    std::size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd_, p + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            complete_later(std::move(done), false, std::string("write ") + path_ + ": " + std::strerror(errno));
            return;
        }
        off += static_cast<std::size_t>(n);
    }
    complete_later(std::move(done), true, std::string());
}

void FileDiskSink::close(Completion done) {
    if (fd_ == -1) {
        complete_later(std::move(done), false, "sink already closed");
        return;
    }
    bool ok = true;
    std::string err;
    if (::fsync(fd_) != 0) {
        ok = false;
        err = std::string("fsync ") + path_ + ": " + std::strerror(errno);
    }
    if (::close(fd_) != 0 && ok) {
        ok = false;
        err = std::string("close ") + path_ + ": " + std::strerror(errno);
    }
    fd_ = -1;
    complete_later(std::move(done), ok, std::move(err));
}

void FileDiskSink::abort() {
    if (fd_ == -1) return;
    ::close(fd_);
    fd_ = -1;
    if (::unlink(path_.c_str()) != 0) {
        log_err("SINK") << "could not remove partial " << path_ << ": " << std::strerror(errno) << std::endl;
    }
}

} // namespace linkshare
