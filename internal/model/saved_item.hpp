#pragma once

#include <cstdint>
#include <string>

namespace favorites::model {

/*
  A saved story.

  IMPORTANT:
  - id is never empty for a persisted record.
  - title may be empty; display title derivation happens at export time.
*/
struct SavedItem {
  std::string  id;
  std::string  url;
  std::string  title;
  std::int64_t saved_at_epoch_seconds = 0;

  bool operator==(const SavedItem&) const = default;
};

} // namespace favorites::model
