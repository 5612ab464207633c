#include "workspace/workspace_state.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "utils/errors.hpp"

namespace kestrel::workspace {
namespace {

std::string ErrnoText(const std::string& what, const std::filesystem::path& path) {
    return what + " " + path.string() + ": " + std::strerror(errno);
}

bool IsLockSidecar(const std::string& name) {
    const std::string suffix = ".lock";
    return name.size() > suffix.size() + 1 && name.front() == '.' &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

class FileLock {
public:
    FileLock(const std::filesystem::path& target, int operation) {
        const auto lock_path = target.parent_path() / ("." + target.filename().string() + ".lock");
        fd_ = ::open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw utils::InfrastructureError("path", ErrnoText("cannot open lock", lock_path));
        }
        while (::flock(fd_, operation) != 0) {
            if (errno != EINTR) {
                const auto message = ErrnoText("cannot lock", lock_path);
                ::close(fd_);
                throw utils::InfrastructureError("path", message);
            }
        }
    }

    ~FileLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

void WriteAll(int fd, const std::string& data, const std::filesystem::path& path) {
    std::size_t offset = 0;
    while (offset < data.size()) {
        const auto written = ::write(fd, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw utils::InfrastructureError("path", ErrnoText("write failed", path));
        }
        offset += static_cast<std::size_t>(written);
    }
}

void EnsureParent(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        throw utils::InfrastructureError(
            "path", "cannot create " + path.parent_path().string() + ": " + ec.message());
    }
}

std::string ReadUnlocked(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return {};
    }
    if (std::filesystem::is_directory(path, ec)) {
        throw utils::ValidationError("path", path.string() + " is a directory");
    }
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        throw utils::InfrastructureError("path", ErrnoText("cannot read", path));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

void WriteAtomic(const std::filesystem::path& path, const std::string& content) {
    static std::atomic<unsigned long> counter{0};
    const auto temp = path.parent_path() /
        ("." + path.filename().string() + ".tmp." + std::to_string(::getpid()) + "." +
         std::to_string(counter.fetch_add(1)));
    const int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw utils::InfrastructureError("path", ErrnoText("cannot create", temp));
    }
    try {
        WriteAll(fd, content, temp);
    } catch (...) {
        ::close(fd);
        ::unlink(temp.c_str());
        throw;
    }
    if (::fsync(fd) != 0) {
        const auto message = ErrnoText("fsync failed", temp);
        ::close(fd);
        ::unlink(temp.c_str());
        throw utils::InfrastructureError("path", message);
    }
    ::close(fd);
    if (::rename(temp.c_str(), path.c_str()) != 0) {
        const auto message = ErrnoText("rename failed", path);
        ::unlink(temp.c_str());
        throw utils::InfrastructureError("path", message);
    }
    const int dir_fd = ::open(path.parent_path().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd >= 0) {
        ::fsync(dir_fd);
        ::close(dir_fd);
    }
}

}  // namespace

WorkspaceState::WorkspaceState(std::filesystem::path root)
    : root_(std::filesystem::absolute(std::move(root)).lexically_normal()) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw utils::InfrastructureError("workspace", "cannot create " + root_.string() + ": " + ec.message());
    }
}

std::filesystem::path WorkspaceState::Resolve(const std::string& path) const {
    if (path.empty()) {
        throw utils::ValidationError("path", "path is required");
    }
    std::filesystem::path candidate(path);
    if (candidate.is_relative()) {
        candidate = root_ / candidate;
    }
    return candidate.lexically_normal();
}

bool WorkspaceState::Contains(const std::filesystem::path& path) const {
    std::error_code ec;
    const auto root = std::filesystem::weakly_canonical(root_, ec);
    const auto target = std::filesystem::weakly_canonical(path, ec);
    const auto relative = target.lexically_relative(root);
    if (relative.empty()) {
        return false;
    }
    return *relative.begin() != "..";
}

void WorkspaceState::Append(const std::string& path, const std::string& text) {
    const auto resolved = Resolve(path);
    EnsureParent(resolved);
    const auto mutex = PathMutex(resolved);
    std::lock_guard<std::mutex> guard(*mutex);
    FileLock lock(resolved, LOCK_EX);
    const int fd = ::open(resolved.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw utils::InfrastructureError("path", ErrnoText("cannot open", resolved));
    }
    try {
        WriteAll(fd, text, resolved);
    } catch (...) {
        ::close(fd);
        throw;
    }
    ::close(fd);
}

std::string WorkspaceState::Read(const std::string& path) const {
    const auto resolved = Resolve(path);
    const auto mutex = PathMutex(resolved);
    std::lock_guard<std::mutex> guard(*mutex);
    std::error_code ec;
    if (!std::filesystem::exists(resolved, ec)) {
        return {};
    }
    FileLock lock(resolved, LOCK_SH);
    return ReadUnlocked(resolved);
}

std::string WorkspaceState::ReadModifyWrite(const std::string& path, const Transform& fn) {
    return Mutate(path, fn, false);
}

void WorkspaceState::Replace(const std::string& path, const std::string& content) {
    Mutate(path, [&content](const std::string&) { return content; }, true);
}

bool WorkspaceState::Exists(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::exists(Resolve(path), ec);
}

std::vector<std::string> WorkspaceState::ListDir(const std::string& path) const {
    const auto resolved = Resolve(path);
    std::error_code ec;
    if (!std::filesystem::is_directory(resolved, ec)) {
        throw utils::ValidationError("path", resolved.string() + " is not a directory");
    }
    std::vector<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(resolved, ec)) {
        auto name = entry.path().filename().string();
        if (IsLockSidecar(name)) {
            continue;
        }
        if (entry.is_directory()) {
            name += "/";
        }
        names.push_back(std::move(name));
    }
    if (ec) {
        throw utils::InfrastructureError("path", "cannot list " + resolved.string() + ": " + ec.message());
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string WorkspaceState::Mutate(const std::string& path, const Transform& fn, bool always_write) {
    const auto resolved = Resolve(path);
    EnsureParent(resolved);
    const auto mutex = PathMutex(resolved);
    std::lock_guard<std::mutex> guard(*mutex);
    FileLock lock(resolved, LOCK_EX);
    std::error_code ec;
    const bool existed = std::filesystem::exists(resolved, ec);
    const auto current = ReadUnlocked(resolved);
    auto updated = fn(current);
    if (updated != current || (always_write && !existed)) {
        WriteAtomic(resolved, updated);
    }
    return updated;
}

std::shared_ptr<std::mutex> WorkspaceState::PathMutex(const std::filesystem::path& resolved) const {
    std::error_code ec;
    auto key = std::filesystem::weakly_canonical(resolved, ec).string();
    if (ec) {
        key = resolved.string();
    }
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& slot = path_mutexes_[key];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

}  // namespace kestrel::workspace
