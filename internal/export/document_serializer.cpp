#include "document_serializer.hpp"

#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace favorites::exporter {

namespace {

constexpr std::string_view kIdPlaceholder = "{id}";

void RequireItems(const std::vector<model::SavedItem>& items, std::string_view format) {
  if (items.empty()) {
    throw std::invalid_argument(std::string(format) + " export requires at least one item");
  }
}

std::string SavedDate(const model::SavedItem& item) {
  return util::FormatLocal(item.saved_at_epoch_seconds, util::kMinutePattern);
}

std::string ReplaceAll(std::string text, std::string_view from, std::string_view to) {
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

} // namespace

std::string DiscussionUrl(const std::string& url_template, const std::string& item_id) {
  return ReplaceAll(url_template, kIdPlaceholder, item_id);
}

std::string ResolveDisplayTitle(const model::SavedItem& item, const SerializeOptions& options) {
  if (options.display_title) {
    auto title = options.display_title(item);
    if (!title.empty()) {
      return title;
    }
  }
  if (!item.title.empty()) {
    return item.title;
  }
  if (!item.url.empty()) {
    return item.url;
  }
  return item.id;
}

std::string EscapeHtml(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#39;";
        break;
      default:
        out += c;
    }
  }
  return out;
}

std::string EscapeJson(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out;
}

// ------------------------------------------------------------
// CSV
// ------------------------------------------------------------

std::string SerializeCsv(const std::vector<model::SavedItem>& items, const SerializeOptions& options) {
  RequireItems(items, "csv");

  std::ostringstream out;
  out << "Title,URL,Hacker News Link,Saved Date\n";
  for (const auto& item : items) {
    out << '"' << ReplaceAll(ResolveDisplayTitle(item, options), "\"", "\"\"") << "\"," << item.url << ','
        << DiscussionUrl(options.discussion_url_template, item.id) << ',' << SavedDate(item) << '\n';
  }
  return out.str();
}

// ------------------------------------------------------------
// Plain text
// ------------------------------------------------------------

std::string SerializeTxt(const std::vector<model::SavedItem>& items, const SerializeOptions& options) {
  RequireItems(items, "txt");

  std::ostringstream out;
  out << "=== " << options.document_title << " ===\n\n";

  std::size_t index = 1;
  for (const auto& item : items) {
    out << index++ << ". " << ResolveDisplayTitle(item, options) << '\n';
    out << "   URL: " << item.url << '\n';
    out << "   HN: " << DiscussionUrl(options.discussion_url_template, item.id) << '\n';
    out << "   Saved: " << SavedDate(item) << '\n';
    out << '\n';
  }
  return out.str();
}

// ------------------------------------------------------------
// HTML
// ------------------------------------------------------------

std::string SerializeHtml(const std::vector<model::SavedItem>& items, const SerializeOptions& options) {
  RequireItems(items, "html");

  const auto title = EscapeHtml(options.document_title);

  std::ostringstream out;
  out << "<!DOCTYPE html>\n";
  out << "<html><head><meta charset=\"UTF-8\">\n";
  out << "<title>" << title << "</title>\n";
  out << "<style>body{font-family:Arial,sans-serif;max-width:800px;margin:0 auto;padding:20px}\n";
  out << ".story{margin-bottom:20px;padding:15px;border:1px solid #ddd;border-radius:8px}\n";
  out << ".title{font-size:18px;font-weight:bold;margin-bottom:8px}\n";
  out << ".meta{color:#666;font-size:14px}</style></head><body>\n";
  out << "<h1>" << title << "</h1>\n";

  for (const auto& item : items) {
    out << "<div class=\"story\">\n";
    out << "<div class=\"title\"><a href=\"" << EscapeHtml(item.url) << "\">" << EscapeHtml(ResolveDisplayTitle(item, options))
        << "</a></div>\n";
    out << "<div class=\"meta\">\n";
    out << "<a href=\"" << EscapeHtml(DiscussionUrl(options.discussion_url_template, item.id))
        << "\">HN Discussion</a> | Saved: " << SavedDate(item) << '\n';
    out << "</div></div>\n";
  }
  out << "</body></html>\n";
  return out.str();
}

// ------------------------------------------------------------
// Markdown
// ------------------------------------------------------------

std::string SerializeMarkdown(const std::vector<model::SavedItem>& items, const SerializeOptions& options) {
  RequireItems(items, "markdown");

  std::ostringstream out;
  out << "# " << options.document_title << "\n\n";
  for (const auto& item : items) {
    out << "## " << ResolveDisplayTitle(item, options) << "\n\n";
    out << "- **URL:** [Link](" << item.url << ")\n";
    out << "- **HN:** [Discussion](" << DiscussionUrl(options.discussion_url_template, item.id) << ")\n";
    out << "- **Saved:** " << SavedDate(item) << "\n\n";
    out << "---\n\n";
  }
  return out.str();
}

// ------------------------------------------------------------
// JSON
// ------------------------------------------------------------

std::string SerializeJson(const std::vector<model::SavedItem>& items, const SerializeOptions& options) {
  RequireItems(items, "json");

  std::ostringstream out;
  out << "{\n";
  out << "  \"exported\": \"" << util::FormatLocal(options.exported_at, util::kIsoSecondPattern) << "\",\n";
  out << "  \"stories\": [\n";

  bool first = true;
  for (const auto& item : items) {
    if (!first) {
      out << ",\n";
    }
    first = false;

    out << "    {\n";
    out << "      \"id\": \"" << EscapeJson(item.id) << "\",\n";
    out << "      \"title\": \"" << EscapeJson(ResolveDisplayTitle(item, options)) << "\",\n";
    out << "      \"url\": \"" << EscapeJson(item.url) << "\",\n";
    out << "      \"hnUrl\": \"" << EscapeJson(DiscussionUrl(options.discussion_url_template, item.id)) << "\",\n";
    out << "      \"savedAt\": \"" << util::FormatLocal(item.saved_at_epoch_seconds, util::kIsoSecondPattern) << "\"\n";
    out << "    }";
  }
  out << "\n  ]\n";
  out << "}\n";
  return out.str();
}

std::string Serialize(model::ExportFormat format, const std::vector<model::SavedItem>& items, const SerializeOptions& options) {
  switch (format) {
    case model::ExportFormat::kCsv:
      return SerializeCsv(items, options);
    case model::ExportFormat::kTxt:
      return SerializeTxt(items, options);
    case model::ExportFormat::kHtml:
      return SerializeHtml(items, options);
    case model::ExportFormat::kMarkdown:
      return SerializeMarkdown(items, options);
    case model::ExportFormat::kJson:
      return SerializeJson(items, options);
  }
  throw std::invalid_argument("unknown export format");
}

} // namespace favorites::exporter
