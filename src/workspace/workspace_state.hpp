#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kestrel::workspace {

// Sole owner of workspace file access. Every mutation is exclusive per path,
// both across threads (per-path mutex) and across processes (flock on a
// sidecar ".<name>.lock" file).
class WorkspaceState {
public:
    using Transform = std::function<std::string(const std::string&)>;

    explicit WorkspaceState(std::filesystem::path root);

    const std::filesystem::path& Root() const { return root_; }

    // Relative paths are taken from the workspace root.
    std::filesystem::path Resolve(const std::string& path) const;
    bool Contains(const std::filesystem::path& path) const;

    // The whole buffer lands in one O_APPEND write under the lock; concurrent
    // appenders never interleave.
    void Append(const std::string& path, const std::string& text);

    // Missing files read as empty.
    std::string Read(const std::string& path) const;

    // Holds the lock across read, transform and write. The new content is
    // written to a temp file, fsynced and renamed over the target. If fn
    // throws, the file is left untouched. Returns the stored content.
    std::string ReadModifyWrite(const std::string& path, const Transform& fn);

    void Replace(const std::string& path, const std::string& content);
    bool Exists(const std::string& path) const;
    std::vector<std::string> ListDir(const std::string& path) const;

private:
    std::string Mutate(const std::string& path, const Transform& fn, bool always_write);
    std::shared_ptr<std::mutex> PathMutex(const std::filesystem::path& resolved) const;

    std::filesystem::path root_;
    mutable std::mutex registry_mutex_;
    mutable std::unordered_map<std::string, std::shared_ptr<std::mutex>> path_mutexes_;
};

}  // namespace kestrel::workspace
