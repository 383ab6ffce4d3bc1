#include "change_token.hpp"

#include <utility>

namespace favorites::model {

namespace {

constexpr std::string_view kAddSegment    = "add";
constexpr std::string_view kRemoveSegment = "remove";
constexpr std::string_view kClearSegment  = "clear";

std::string BuildPath(std::string_view segment) {
  std::string path(kSavedBasePath);
  path += '/';
  path += segment;
  return path;
}

bool HasSegment(std::string_view path, std::string_view segment) {
  const auto prefix = BuildPath(segment);
  if (path.substr(0, prefix.size()) != prefix) {
    return false;
  }
  // "favorites://saved/add" must not match "favorites://saved/addition"
  return path.size() == prefix.size() || path[prefix.size()] == '/';
}

std::string Remainder(std::string_view path, std::string_view segment) {
  const auto prefix = BuildPath(segment);
  if (path.size() <= prefix.size() + 1) {
    return {};
  }
  return std::string(path.substr(prefix.size() + 1));
}

} // namespace

ChangeToken ChangeToken::Added(std::string id) {
  return ChangeToken{ChangeKind::kAdded, std::move(id), std::nullopt};
}

ChangeToken ChangeToken::Removed(std::string id) {
  return ChangeToken{ChangeKind::kRemoved, std::move(id), std::nullopt};
}

ChangeToken ChangeToken::Cleared(std::size_t deleted) {
  return ChangeToken{ChangeKind::kCleared, {}, deleted};
}

std::string ChangeToken::Path() const {
  switch (kind) {
    case ChangeKind::kAdded:
      return BuildPath(kAddSegment) + "/" + item_id;
    case ChangeKind::kRemoved:
      return BuildPath(kRemoveSegment) + "/" + item_id;
    case ChangeKind::kCleared:
      return BuildPath(kClearSegment);
  }
  return std::string(kSavedBasePath);
}

bool IsAdded(std::string_view path) {
  return HasSegment(path, kAddSegment);
}

bool IsRemoved(std::string_view path) {
  return HasSegment(path, kRemoveSegment);
}

bool IsCleared(std::string_view path) {
  return HasSegment(path, kClearSegment);
}

std::optional<ChangeToken> ParseChangeToken(std::string_view path) {
  if (IsAdded(path)) {
    return ChangeToken::Added(Remainder(path, kAddSegment));
  }
  if (IsRemoved(path)) {
    return ChangeToken::Removed(Remainder(path, kRemoveSegment));
  }
  if (IsCleared(path)) {
    return ChangeToken{ChangeKind::kCleared, {}, std::nullopt};
  }
  return std::nullopt;
}

} // namespace favorites::model
