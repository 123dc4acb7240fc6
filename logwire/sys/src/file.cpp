#include "logwire/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "logwire/errno-throw.hpp"
#include "logwire/log.hpp"

namespace logwire {

File::File(const std::string& path) : _path(path), _fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {
  if (!_fd) {
    throw_errno("Unable to open file '{}'", path);
  }
}

std::size_t File::size() const {
  struct stat st{};
  if (::fstat(_fd.fd(), &st) != 0) {
    throw_errno("fstat failed for '{}'", _path);
  }
  return static_cast<std::size_t>(st.st_size);
}

std::vector<std::byte> File::loadAllContent() const {
  std::vector<std::byte> content(size());
  std::size_t pos = 0;
  while (true) {
    if (pos == content.size()) {
      // The file may have grown since size() was taken.
      content.resize(content.size() + 8192);
    }
    const auto nbRead = ::pread(_fd.fd(), content.data() + pos, content.size() - pos, static_cast<off_t>(pos));
    if (nbRead > 0) {
      pos += static_cast<std::size_t>(nbRead);
      continue;
    }
    if (nbRead == 0) {
      break;
    }
    if (errno == EINTR) {
      continue;
    }
    throw_errno("Unable to read file '{}'", _path);
  }
  content.resize(pos);
  log::debug("Loaded {} bytes from '{}'", pos, _path);
  return content;
}

std::string_view File::fileName() const noexcept {
  std::string_view name(_path);
  const auto slashPos = name.find_last_of('/');
  if (slashPos != std::string_view::npos) {
    name.remove_prefix(slashPos + 1);
  }
  return name;
}

}  // namespace logwire
