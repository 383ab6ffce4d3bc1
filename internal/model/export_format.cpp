#include "export_format.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace favorites::model {

std::string_view Name(ExportFormat format) {
  switch (format) {
    case ExportFormat::kCsv:
      return "CSV";
    case ExportFormat::kTxt:
      return "TXT";
    case ExportFormat::kHtml:
      return "HTML";
    case ExportFormat::kMarkdown:
      return "MARKDOWN";
    case ExportFormat::kJson:
      return "JSON";
  }
  return "UNKNOWN";
}

std::string_view Extension(ExportFormat format) {
  switch (format) {
    case ExportFormat::kCsv:
      return "csv";
    case ExportFormat::kTxt:
      return "txt";
    case ExportFormat::kHtml:
      return "html";
    case ExportFormat::kMarkdown:
      return "md";
    case ExportFormat::kJson:
      return "json";
  }
  return "bin";
}

std::string_view MimeType(ExportFormat format) {
  switch (format) {
    case ExportFormat::kCsv:
      return "text/csv";
    case ExportFormat::kTxt:
      return "text/plain";
    case ExportFormat::kHtml:
      return "text/html";
    case ExportFormat::kMarkdown:
      return "text/markdown";
    case ExportFormat::kJson:
      return "application/json";
  }
  return "application/octet-stream";
}

std::optional<ExportFormat> ParseExportFormat(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return std::tolower(c); });

  for (const auto format : kAllExportFormats) {
    std::string name(Name(format));
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lowered == name || lowered == Extension(format)) {
      return format;
    }
  }
  return std::nullopt;
}

} // namespace favorites::model
