#pragma once

#include "component.h"

#include <memory>
#include <string>
#include <string_view>

namespace sdkgraph {

// Generated API stubs sources; has no dependencies of its own.
class droidstubs : public component_module {
 public:
  droidstubs(props p, std::string variant);

  static std::unique_ptr<module> create(sol::table const &table, std::string variant);

  std::string_view type_name() const override { return "droidstubs"; }
};

}  // namespace sdkgraph
