#pragma once

#include <functional>
#include <string>
#include <vector>

#include "internal/model/export_format.hpp"
#include "internal/model/saved_item.hpp"
#include "internal/util/time.hpp"

namespace favorites::exporter {

inline constexpr const char* kDefaultDocumentTitle         = "Saved Stories";
inline constexpr const char* kDefaultDiscussionUrlTemplate = "https://news.ycombinator.com/item?id={id}";

struct SerializeOptions {
  std::string document_title          = kDefaultDocumentTitle;
  std::string discussion_url_template = kDefaultDiscussionUrlTemplate;

  // Stamped into the JSON "exported" field.
  util::TimePoint exported_at = util::Now();

  // Display title collaborator. Unset or empty result falls back to
  // title, then url, then id.
  std::function<std::string(const model::SavedItem&)> display_title;
};

/*
  Document serializers.

  Pure functions of (items, options). Items are emitted in the order
  given, one block per item. Dates use local time. Every serializer
  throws std::invalid_argument for an empty item list.
*/

std::string DiscussionUrl(const std::string& url_template, const std::string& item_id);
std::string ResolveDisplayTitle(const model::SavedItem& item, const SerializeOptions& options);

std::string EscapeHtml(const std::string& text);
std::string EscapeJson(const std::string& text);

std::string SerializeCsv(const std::vector<model::SavedItem>& items, const SerializeOptions& options);
std::string SerializeTxt(const std::vector<model::SavedItem>& items, const SerializeOptions& options);
std::string SerializeHtml(const std::vector<model::SavedItem>& items, const SerializeOptions& options);
std::string SerializeMarkdown(const std::vector<model::SavedItem>& items, const SerializeOptions& options);
std::string SerializeJson(const std::vector<model::SavedItem>& items, const SerializeOptions& options);

std::string Serialize(model::ExportFormat format, const std::vector<model::SavedItem>& items, const SerializeOptions& options);

} // namespace favorites::exporter
