#include "internal/activity/activity_registry.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace flowstead::activity {

void ActivityRegistry::Register(const std::string& name, ActivityFn fn) {
  if (name.empty()) throw std::invalid_argument("activity type name must not be empty");
  if (!fn) throw std::invalid_argument("activity " + name + " has no implementation");

  std::lock_guard lock(mutex_);
  if (!activities_.emplace(name, std::move(fn)).second) {
    throw util::AlreadyExists("activity type already registered: " + name);
  }
}

ActivityFn ActivityRegistry::Lookup(const std::string& name) const {
  std::lock_guard lock(mutex_);
  auto            it = activities_.find(name);
  if (it == activities_.end()) {
    throw util::NotFound("activity type not registered: " + name);
  }
  return it->second;
}

bool ActivityRegistry::Contains(const std::string& name) const {
  std::lock_guard lock(mutex_);
  return activities_.count(name) > 0;
}

void ActivityRegistry::Validate(const std::vector<std::string>& names) const {
  std::string missing;
  for (const auto& name : names) {
    if (Contains(name)) continue;
    missing += missing.empty() ? name : ", " + name;
  }
  if (!missing.empty()) {
    throw util::NotFound("activity types not registered: " + missing);
  }
}

std::vector<std::string> ActivityRegistry::Names() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> names;
  names.reserve(activities_.size());
  for (const auto& [name, fn] : activities_) {
    names.push_back(name);
  }
  return names;
}

} // namespace flowstead::activity
