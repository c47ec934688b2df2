#include "temp_directory.hpp"

#include <random>

namespace hrec::test {

TempDirectory::TempDirectory() {
  createTempDir();
}

TempDirectory::~TempDirectory() {
  cleanup();
}

void TempDirectory::createTempDir() {
  auto base = std::filesystem::temp_directory_path() / "hrec_test";

  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 999999);

  path_ = base / ("tmp_" + std::to_string(dis(gen)));
  while (std::filesystem::exists(path_)) {
    path_ = base / ("tmp_" + std::to_string(dis(gen)));
  }

  std::filesystem::create_directories(path_);
}

void TempDirectory::cleanup() {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  // Tests may leave read-only directories behind
  for (auto it = std::filesystem::recursive_directory_iterator(path_, ec);
       !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    std::filesystem::permissions(it->path(), std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::add, ec);
  }
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempDirectory::createSubdir(const std::string& name) {
  auto subdir = path_ / name;
  std::filesystem::create_directories(subdir);
  return subdir;
}

std::filesystem::path TempDirectory::createFile(const std::string& name, const std::string& content) {
  auto file_path = path_ / name;
  std::filesystem::create_directories(file_path.parent_path());
  std::ofstream file(file_path, std::ios::binary);
  if (file) {
    file << content;
  }
  return file_path;
}

}  // namespace hrec::test
