#include "cc_library.h"

#include <utility>

namespace sdkgraph {

cc_library::cc_library(props p, std::string variant)
    : component_module{ std::move(p), std::move(variant) } {}

std::unique_ptr<module> cc_library::create(sol::table const &table, std::string variant) {
  sol_util_check_keys(
      table,
      { "name", "variants", "sdk_member_name", "deps", "stub_deps", "defaults" },
      "cc_library");

  auto p{ parse_common_props(table, "cc_library") };
  p.deps = sol_util_get_string_list(table, "deps", "cc_library");
  p.stub_deps = sol_util_get_string_list(table, "stub_deps", "cc_library");
  p.defaults = sol_util_get_string_list(table, "defaults", "cc_library");
  return std::make_unique<cc_library>(std::move(p), std::move(variant));
}

}  // namespace sdkgraph
