#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "internal/export/writable_sink.hpp"

namespace favorites::exporter {

/*
  A user-chosen export target.

  Open() is called once, on the background context. A null sink means
  the destination could not be opened.
*/
class Destination {
 public:
  virtual ~Destination() = default;

  virtual std::unique_ptr<WritableSink> Open() = 0;

  virtual std::string Describe() const = 0;
};

class FileDestination final : public Destination {
 public:
  explicit FileDestination(std::filesystem::path path);

  std::unique_ptr<WritableSink> Open() override;
  std::string                   Describe() const override;

 private:
  std::filesystem::path path_;
};

} // namespace favorites::exporter
