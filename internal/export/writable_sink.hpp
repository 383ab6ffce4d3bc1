#pragma once

#include <filesystem>
#include <fstream>
#include <string_view>

namespace favorites::exporter {

/*
  Byte sink an export is written into.

  Write() may be called repeatedly. Close() flushes and releases the
  underlying resource; writing after Close() is an error.
*/
class WritableSink {
 public:
  virtual ~WritableSink() = default;

  virtual void Write(std::string_view data) = 0;
  virtual void Flush()                      = 0;
  virtual void Close()                      = 0;
};

/*
  Truncating file sink. Throws util::DeliveryError on any stream failure.
*/
class FileSink final : public WritableSink {
 public:
  explicit FileSink(std::filesystem::path path);
  ~FileSink() override;

  void Write(std::string_view data) override;
  void Flush() override;
  void Close() override;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
  std::ofstream         out_;
};

// Streams the whole of source into sink, then flushes it. Does not close.
void CopyFile(const std::filesystem::path& source, WritableSink& sink);

} // namespace favorites::exporter
