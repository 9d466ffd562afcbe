#include "defaults.h"

#include <utility>

namespace sdkgraph {

defaults_module::defaults_module(props p, std::string variant)
    : module{ p.name, std::move(variant) }, props_{ std::move(p) } {}

std::unique_ptr<module> defaults_module::create(sol::table const &table, std::string variant) {
  sol_util_check_keys(table, { "name", "variants", "deps", "stub_deps" }, "defaults");
  return std::make_unique<defaults_module>(
      props{ .name = sol_util_get_required<std::string>(table, "name", "defaults"),
             .deps = sol_util_get_string_list(table, "deps", "defaults"),
             .stub_deps = sol_util_get_string_list(table, "stub_deps", "defaults") },
      std::move(variant));
}

}  // namespace sdkgraph
