#pragma once

#include <filesystem>
#include <string_view>

namespace logwire::test {

// Unique directory under the system temp directory, removed with its content on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "logwire-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Creates (or overwrites) file 'name' in this directory with 'content' and returns its path.
  std::filesystem::path writeFile(std::string_view name, std::string_view content) const;

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

}  // namespace logwire::test
