#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace favorites::model {

enum class ExportFormat {
  kCsv,
  kTxt,
  kHtml,
  kMarkdown,
  kJson,
};

inline constexpr std::array<ExportFormat, 5> kAllExportFormats = {
    ExportFormat::kCsv, ExportFormat::kTxt, ExportFormat::kHtml, ExportFormat::kMarkdown, ExportFormat::kJson};

std::string_view Name(ExportFormat format);
std::string_view Extension(ExportFormat format);
std::string_view MimeType(ExportFormat format);

// Accepts the format name or its file extension, case-insensitive.
std::optional<ExportFormat> ParseExportFormat(std::string_view text);

} // namespace favorites::model
