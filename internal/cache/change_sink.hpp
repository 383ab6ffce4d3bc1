#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/change_token.hpp"

namespace favorites::cache {

struct MutationFailure {
  model::ChangeKind          kind = model::ChangeKind::kAdded;
  std::vector<std::string>   item_ids;
  std::optional<std::string> filter;
  std::string                message;
};

/*
  Receives mutation outcomes on the interactive context.
*/
class ChangeSink {
 public:
  virtual ~ChangeSink() = default;

  virtual void SetValue(const model::ChangeToken& token) = 0;

  virtual void OnMutationFailed(const MutationFailure& failure) = 0;
};

/*
  Background content refresh for a newly saved item.

  Fire-and-forget: failures are never surfaced to the caller.
*/
class SyncScheduler {
 public:
  virtual ~SyncScheduler() = default;

  virtual void ScheduleSync(const std::string& item_id) = 0;
};

} // namespace favorites::cache
