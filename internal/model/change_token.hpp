#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace favorites::model {

enum class ChangeKind {
  kAdded,
  kRemoved,
  kCleared,
};

/*
  UI-addressable change event published after a mutation completes.

  Rendered as a path under favorites://saved:
    favorites://saved/add/<id>
    favorites://saved/remove/<id>
    favorites://saved/clear
*/
struct ChangeToken {
  ChangeKind  kind = ChangeKind::kAdded;
  std::string item_id;

  // Number of deleted records, only set for kCleared.
  std::optional<std::size_t> deleted_count;

  static ChangeToken Added(std::string id);
  static ChangeToken Removed(std::string id);
  static ChangeToken Cleared(std::size_t deleted);

  std::string Path() const;
};

inline constexpr std::string_view kSavedBasePath = "favorites://saved";

bool IsAdded(std::string_view path);
bool IsRemoved(std::string_view path);
bool IsCleared(std::string_view path);

// Returns nullopt for paths outside favorites://saved.
std::optional<ChangeToken> ParseChangeToken(std::string_view path);

} // namespace favorites::model
