#pragma once

#include "leakguard/leak/category.hpp"

#include <string>

namespace leakguard::leak {

/// One detected occurrence of confidential content in a document.
struct LeakFinding {
  LeakCategory category = LeakCategory::EntityNames;
  std::string entity_name;
  std::string detail;

  bool operator==(const LeakFinding &) const = default;
};

} // namespace leakguard::leak
