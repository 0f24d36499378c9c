#include "temp_directory.hpp"

#include <cstdlib>
#include <fstream>
#include <random>

namespace scapi::test {

TempDirectory::TempDirectory() {
  auto base = std::filesystem::temp_directory_path() / "scapi_test";

  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 999999);

  do {
    path_ = base / ("tmp_" + std::to_string(dis(gen)));
  } while (std::filesystem::exists(path_));

  std::filesystem::create_directories(path_);
}

TempDirectory::~TempDirectory() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempDirectory::writeFile(const std::string& relative, const std::string& content) {
  auto file_path = path_ / relative;
  std::filesystem::create_directories(file_path.parent_path());
  std::ofstream file(file_path, std::ios::binary);
  file << content;
  return file_path;
}

ScopedEnv::ScopedEnv(std::string name, const std::string& value) : name_(std::move(name)) {
  if (const char* current = std::getenv(name_.c_str())) {
    previous_ = current;
  }
  ::setenv(name_.c_str(), value.c_str(), 1);
}

ScopedEnv::~ScopedEnv() {
  if (previous_) {
    ::setenv(name_.c_str(), previous_->c_str(), 1);
  } else {
    ::unsetenv(name_.c_str());
  }
}

}  // namespace scapi::test
