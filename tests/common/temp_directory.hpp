#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace scapi::test {

// RAII temporary directory, removed with everything in it on destruction
class TempDirectory {
public:
  TempDirectory();
  ~TempDirectory();

  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;

  const std::filesystem::path& path() const { return path_; }

  // Write `content` to a file below the directory, creating parents
  std::filesystem::path writeFile(const std::string& relative, const std::string& content);

private:
  std::filesystem::path path_;
};

// Sets an environment variable for the lifetime of the object and restores
// the previous value afterwards
class ScopedEnv {
public:
  ScopedEnv(std::string name, const std::string& value);
  ~ScopedEnv();

  ScopedEnv(const ScopedEnv&) = delete;
  ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
  std::string name_;
  std::optional<std::string> previous_;
};

}  // namespace scapi::test
