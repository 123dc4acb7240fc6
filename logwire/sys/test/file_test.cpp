#include "logwire/file.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <system_error>
#include <vector>

#include "logwire/temp-file.hpp"

namespace logwire {

TEST(File, LoadsWholeContent) {
  test::ScopedTempDir dir;
  std::string content(100000, '\0');
  for (std::size_t pos = 0; pos < content.size(); ++pos) {
    content[pos] = static_cast<char>('a' + (pos % 26));
  }
  const auto path = dir.writeFile("signals.log", content);

  File file(path.string());
  EXPECT_EQ(file.size(), content.size());
  EXPECT_EQ(file.fileName(), "signals.log");

  const auto loaded = file.loadAllContent();
  ASSERT_EQ(loaded.size(), content.size());
  EXPECT_EQ(std::string(reinterpret_cast<const char*>(loaded.data()), loaded.size()), content);
  // Reading twice gives the same result.
  EXPECT_EQ(file.loadAllContent(), loaded);
}

TEST(File, EmptyFile) {
  test::ScopedTempDir dir;
  File file(dir.writeFile("empty.txt", "").string());
  EXPECT_EQ(file.size(), 0U);
  EXPECT_TRUE(file.loadAllContent().empty());
}

TEST(File, MissingFileThrows) {
  test::ScopedTempDir dir;
  EXPECT_THROW(File((dir.dirPath() / "missing.log").string()), std::system_error);
}

TEST(File, FileNameWithoutDirectory) {
  test::ScopedTempDir dir;
  const auto path = dir.writeFile("map.xml", "<map/>");
  EXPECT_EQ(File(path.string()).fileName(), "map.xml");
}

}  // namespace logwire
