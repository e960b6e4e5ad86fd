#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace chunkcast {

// Maps requested names onto regular files below a root directory.
class FileNamespace {
public:
    explicit FileNamespace(std::filesystem::path root);
    // nullopt for empty, absolute or ".."-bearing names, for anything that is
    // not a regular file, and for symlinks that leave the root.
    std::optional<std::filesystem::path> resolve(const std::string& name) const;
    const std::filesystem::path& root() const { return root_; }
private:
    std::filesystem::path root_;
};

} // namespace chunkcast
