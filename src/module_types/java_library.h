#pragma once

#include "component.h"

#include <memory>
#include <string>
#include <string_view>

namespace sdkgraph {

// `libs` are compiled against and bundled, so they are plain dependencies.
class java_library : public component_module {
 public:
  java_library(props p, std::string variant);

  static std::unique_ptr<module> create(sol::table const &table, std::string variant);

  std::string_view type_name() const override { return "java_library"; }
};

}  // namespace sdkgraph
