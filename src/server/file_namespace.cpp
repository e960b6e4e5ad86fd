#include "file_namespace.hpp"
#include <algorithm>

namespace fs = std::filesystem;

namespace chunkcast {

FileNamespace::FileNamespace(fs::path root) {
  std::error_code ec;
  auto canon = fs::weakly_canonical(root, ec);
  root_ = ec ? root.lexically_normal() : canon;
  // "dir/" canonicalises with an empty trailing element
  if (root_.has_relative_path() && root_.filename().empty())
    root_ = root_.parent_path();
}

std::optional<fs::path> FileNamespace::resolve(const std::string &name) const {
  if (name.empty() || name.find('\0') != std::string::npos)
    return std::nullopt;
  fs::path rel(name);
  if (rel.is_absolute() || rel.has_root_name() || rel.has_root_directory())
    return std::nullopt;
  for (const auto &part : rel)
    if (part == "..")
      return std::nullopt;

  fs::path full = root_ / rel;
  std::error_code ec;
  if (!fs::is_regular_file(full, ec) || ec)
    return std::nullopt;

  fs::path canon = fs::canonical(full, ec);
  if (ec)
    return std::nullopt;
  auto mm = std::mismatch(root_.begin(), root_.end(), canon.begin(), canon.end());
  if (mm.first != root_.end())
    return std::nullopt;
  return canon;
}

} // namespace chunkcast
