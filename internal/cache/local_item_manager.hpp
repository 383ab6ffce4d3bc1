#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "internal/model/saved_item.hpp"

namespace favorites::cache {

/*
  Listing contract consumed by the UI.

  Attach() binds an observer and a filter; the observer is told whenever
  a fresh result is available, after which Size()/ItemAt() reflect it.
  All calls happen on the interactive context.
*/
class LocalItemManager {
 public:
  class Observer {
   public:
    virtual ~Observer() = default;

    virtual void OnChanged() = 0;
  };

  virtual ~LocalItemManager() = default;

  virtual std::size_t Size() const = 0;

  virtual std::optional<model::SavedItem> ItemAt(std::size_t position) = 0;

  virtual void Attach(std::shared_ptr<Observer> observer, std::optional<std::string> filter) = 0;

  virtual void Detach() = 0;
};

} // namespace favorites::cache
