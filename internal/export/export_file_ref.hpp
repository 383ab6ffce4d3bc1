#pragma once

#include <filesystem>
#include <string>

#include "internal/model/export_format.hpp"

namespace favorites::exporter {

// A written export file, addressable by path or file:// URI.
struct ExportFileRef {
  std::filesystem::path path;
  model::ExportFormat   format = model::ExportFormat::kCsv;

  std::string Uri() const {
    return "file://" + std::filesystem::absolute(path).string();
  }

  bool operator==(const ExportFileRef&) const = default;
};

} // namespace favorites::exporter
