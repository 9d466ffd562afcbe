#include "java_library.h"

#include <utility>

namespace sdkgraph {

java_library::java_library(props p, std::string variant)
    : component_module{ std::move(p), std::move(variant) } {}

std::unique_ptr<module> java_library::create(sol::table const &table, std::string variant) {
  sol_util_check_keys(table,
                      { "name", "variants", "sdk_member_name", "libs", "defaults" },
                      "java_library");

  auto p{ parse_common_props(table, "java_library") };
  p.deps = sol_util_get_string_list(table, "libs", "java_library");
  p.defaults = sol_util_get_string_list(table, "defaults", "java_library");
  return std::make_unique<java_library>(std::move(p), std::move(variant));
}

}  // namespace sdkgraph
