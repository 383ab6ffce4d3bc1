#pragma once

#include <string>

#include "internal/export/export_file_ref.hpp"

namespace favorites::exporter {

// Hands a finished export file to the platform share flow.
class ShareLauncher {
 public:
  virtual ~ShareLauncher() = default;

  virtual void Share(const ExportFileRef& file) = 0;
};

/*
  Runs a shell command for the file, e.g. "xdg-open {path}".

  {path} and {uri} placeholders are replaced by the single-quoted file
  path and URI; with neither present the quoted path is appended.
  Throws util::DeliveryError when the command exits non-zero.
*/
class CommandShareLauncher final : public ShareLauncher {
 public:
  explicit CommandShareLauncher(std::string command);

  void Share(const ExportFileRef& file) override;

  std::string BuildCommand(const ExportFileRef& file) const;

 private:
  std::string command_;
};

} // namespace favorites::exporter
