#pragma once

#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

namespace spicat {
namespace testing {

/**
 * @brief Unique file under /tmp, removed when the fixture goes out of scope
 */
class TempFile {
 public:
  explicit TempFile(const std::string& contents = "") {
    char name[] = "/tmp/spicat_test_XXXXXX";
    int fd = ::mkstemp(name);
    EXPECT_GE(fd, 0) << "mkstemp failed";
    if (fd >= 0) {
      if (!contents.empty()) {
        EXPECT_EQ(::write(fd, contents.data(), contents.size()),
                  static_cast<ssize_t>(contents.size()));
      }
      ::close(fd);
    }
    path_ = name;
  }

  ~TempFile() { ::unlink(path_.c_str()); }

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  const std::string& path() const { return path_; }

  std::string Read() const {
    std::ifstream in(path_, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
  }

 private:
  std::string path_;
};

}  // namespace testing
}  // namespace spicat
