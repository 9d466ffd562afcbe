#pragma once

#include "component.h"

#include <memory>
#include <string>
#include <string_view>

namespace sdkgraph {

class cc_library : public component_module {
 public:
  cc_library(props p, std::string variant);

  static std::unique_ptr<module> create(sol::table const &table, std::string variant);

  std::string_view type_name() const override { return "cc_library"; }
};

}  // namespace sdkgraph
