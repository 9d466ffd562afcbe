#include "droidstubs.h"

#include <utility>

namespace sdkgraph {

droidstubs::droidstubs(props p, std::string variant)
    : component_module{ std::move(p), std::move(variant) } {}

std::unique_ptr<module> droidstubs::create(sol::table const &table, std::string variant) {
  sol_util_check_keys(table, { "name", "variants", "sdk_member_name" }, "droidstubs");
  return std::make_unique<droidstubs>(parse_common_props(table, "droidstubs"),
                                      std::move(variant));
}

}  // namespace sdkgraph
