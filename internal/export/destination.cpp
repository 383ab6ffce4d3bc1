#include "destination.hpp"

namespace favorites::exporter {

FileDestination::FileDestination(std::filesystem::path path) : path_(std::move(path)) {
}

std::unique_ptr<WritableSink> FileDestination::Open() {
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path());
  }
  return std::make_unique<FileSink>(path_);
}

std::string FileDestination::Describe() const {
  return path_.string();
}

} // namespace favorites::exporter
