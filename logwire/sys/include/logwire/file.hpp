#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "logwire/base-fd.hpp"

namespace logwire {

// Read only file opened by path.
class File {
 public:
  // Throws std::system_error if the file cannot be opened.
  explicit File(const std::string& path);

  // Size in bytes at the time of the call. Throws std::system_error on failure.
  [[nodiscard]] std::size_t size() const;

  // Read the whole file from its start. Throws std::system_error on read failure.
  [[nodiscard]] std::vector<std::byte> loadAllContent() const;

  // Last path component, used as upload name.
  [[nodiscard]] std::string_view fileName() const noexcept;

  [[nodiscard]] const std::string& path() const noexcept { return _path; }

 private:
  std::string _path;
  BaseFd _fd;
};

}  // namespace logwire
