#include "fs.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>
#include <fmt/core.h>

#include <sys/file.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace extsort::adapters::fs {

namespace {

constexpr std::size_t kBufferSize = 64 * 1024;

class FileDescriptor {
public:
    explicit FileDescriptor(int fd = -1) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] auto get() const -> int { return fd_; }
    [[nodiscard]] auto valid() const -> bool { return fd_ != -1; }

    // Закрывает дескриптор и возвращает errno close(), 0 при успехе
    auto close() -> int {
        if (fd_ == -1) return 0;
        const int rc = ::close(fd_);
        fd_ = -1;
        return rc == -1 ? errno : 0;
    }

    void reset() {
        if (fd_ != -1) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

// Удаляет созданный нами dst, если копирование не дошло до конца
class PartialFileGuard {
public:
    explicit PartialFileGuard(const std::filesystem::path& path) : path_(path) {}
    ~PartialFileGuard() {
        if (armed_) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
            if (ec) {
                spdlog::warn("Cannot remove partial file {}: {}", path_.string(), ec.message());
            }
        }
    }

    PartialFileGuard(const PartialFileGuard&) = delete;
    PartialFileGuard& operator=(const PartialFileGuard&) = delete;

    void release() { armed_ = false; }

private:
    const std::filesystem::path& path_;
    bool armed_ = true;
};

auto write_all(int fd, const char* data, std::size_t size) -> infra::VoidResult {
    while (size > 0) {
        const ssize_t written = ::write(fd, data, size);
        if (written == -1) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::error_from_errno(errno, "write failed"));
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return {};
}

auto copy_buffered(int src_fd, int dst_fd) -> infra::Result<std::uintmax_t> {
    std::vector<char> buffer(kBufferSize);
    std::uintmax_t total = 0;

    for (;;) {
        const ssize_t n = ::read(src_fd, buffer.data(), buffer.size());
        if (n == -1) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::error_from_errno(errno, "read failed"));
        }
        if (n == 0) break;

        auto res = write_all(dst_fd, buffer.data(), static_cast<std::size_t>(n));
        if (!res) return std::unexpected(std::move(res.error()));
        total += static_cast<std::uintmax_t>(n);
    }
    return total;
}

auto copy_mmap(int src_fd, int dst_fd, std::uintmax_t size) -> infra::Result<std::uintmax_t> {
    void* src_map = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, src_fd, 0);
    if (src_map == MAP_FAILED) {
        // Некоторые ФС не поддерживают mmap: откат на буферизованное копирование
        spdlog::debug("mmap failed ({}), falling back to buffered copy", std::strerror(errno));
        return copy_buffered(src_fd, dst_fd);
    }

    auto res = write_all(dst_fd, static_cast<const char*>(src_map), size);
    ::munmap(src_map, size);

    if (!res) return std::unexpected(std::move(res.error()));
    return size;
}

} // namespace

auto select_strategy(std::uintmax_t file_size) -> CopyStrategy {
    if (file_size < 1'000'000) return CopyStrategy::Buffered;
    return CopyStrategy::MMap;
}

auto copy_file(const std::filesystem::path& src,
               const std::filesystem::path& dst) -> infra::Result<std::uintmax_t>
{
    struct stat sb;
    if (::stat(src.c_str(), &sb) == -1) {
        return std::unexpected(infra::error_from_errno(
            errno, fmt::format("Cannot stat {}", src.string())));
    }
    return copy_file(src, dst, select_strategy(static_cast<std::uintmax_t>(sb.st_size)));
}

auto copy_file(const std::filesystem::path& src,
               const std::filesystem::path& dst,
               CopyStrategy strategy) -> infra::Result<std::uintmax_t>
{
    FileDescriptor src_fd{::open(src.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!src_fd.valid()) {
        return std::unexpected(infra::error_from_errno(
            errno, fmt::format("Cannot open source {}", src.string())));
    }

    // Файл, на котором другой процесс держит LOCK_EX, считается заблокированным
    if (::flock(src_fd.get(), LOCK_SH | LOCK_NB) == -1) {
        const int err = errno;
        if (err == EWOULDBLOCK) {
            return std::unexpected(infra::make_error(infra::ErrorCode::FileLocked,
                fmt::format("Source is locked by another process: {}", src.string())));
        }
        if (err != ENOLCK && err != EINVAL && err != EOPNOTSUPP) {
            return std::unexpected(infra::error_from_errno(
                err, fmt::format("Cannot lock source {}", src.string())));
        }
        // ФС без поддержки flock: копируем без проверки
    }

    struct stat sb;
    if (::fstat(src_fd.get(), &sb) == -1) {
        return std::unexpected(infra::error_from_errno(
            errno, fmt::format("Cannot stat {}", src.string())));
    }
    if (!S_ISREG(sb.st_mode)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Not a regular file: {}", src.string())));
    }

    FileDescriptor dst_fd{::open(dst.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644)};
    if (!dst_fd.valid()) {
        return std::unexpected(infra::error_from_errno(
            errno, fmt::format("Cannot create destination {}", dst.string())));
    }
    PartialFileGuard guard{dst};

    const auto size = static_cast<std::uintmax_t>(sb.st_size);
    auto res = (strategy == CopyStrategy::MMap && size > 0)
        ? copy_mmap(src_fd.get(), dst_fd.get(), size)
        : copy_buffered(src_fd.get(), dst_fd.get());
    if (!res) {
        return std::unexpected(infra::make_error(res.error().code,
            fmt::format("{} -> {}: {}", src.string(), dst.string(), res.error().message)));
    }

    // close() может вернуть отложенную ошибку записи (ENOSPC, EIO)
    if (const int err = dst_fd.close(); err != 0) {
        return std::unexpected(infra::error_from_errno(
            err, fmt::format("Cannot finalize {}", dst.string())));
    }

    guard.release();
    return *res;
}

auto copy_metadata(const std::filesystem::path& src,
                   const std::filesystem::path& dst) -> infra::VoidResult
{
    std::error_code ec;

    auto time = std::filesystem::last_write_time(src, ec);
    if (!ec) {
        std::filesystem::last_write_time(dst, time, ec);
    }

    if (!ec) {
        auto perms = std::filesystem::status(src, ec).permissions();
        if (!ec) {
            std::filesystem::permissions(dst, perms, ec);
        }
    }

    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                             fmt::format("Metadata copy failed: {}", ec.message())));
    }
    return {};
}

} // namespace extsort::adapters::fs
