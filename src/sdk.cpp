#include "sdk.h"

#include "mutator_ctx.h"
#include "snapshot_builder.h"
#include "tui.h"

#include <utility>

namespace sdkgraph {

sdk_module::sdk_module(props p, std::string variant, bool snapshot)
    : module{ p.name, std::move(variant) }, props_{ std::move(p) }, snapshot_{ snapshot } {}

sdk_module::props sdk_module::parse_props(sol::table const &table, std::string_view context) {
  return props{
    .name = sol_util_get_required<std::string>(table, "name", context),
    .members = { .java_header_libs =
                     sol_util_get_string_list(table, "java_header_libs", context),
                 .java_libs = sol_util_get_string_list(table, "java_libs", context),
                 .native_shared_libs =
                     sol_util_get_string_list(table, "native_shared_libs", context),
                 .stubs_sources = sol_util_get_string_list(table, "stubs_sources", context) },
  };
}

std::unique_ptr<module> sdk_module::create_sdk(sol::table const &table, std::string variant) {
  sol_util_check_keys(table,
                      { "name",
                        "variants",
                        "java_header_libs",
                        "java_libs",
                        "native_shared_libs",
                        "stubs_sources" },
                      "sdk");
  return std::make_unique<sdk_module>(
      parse_props(table, "sdk"),
      std::move(variant),
      false);
}

std::unique_ptr<module> sdk_module::create_snapshot(sol::table const &table,
                                                    std::string variant) {
  sol_util_check_keys(table,
                      { "name",
                        "variants",
                        "java_header_libs",
                        "java_libs",
                        "native_shared_libs",
                        "stubs_sources" },
                      "sdk_snapshot");
  return std::make_unique<sdk_module>(
      parse_props(table, "sdk_snapshot"),
      std::move(variant),
      true);
}

void sdk_module::generate_build_actions(build_ctx &ctx) {
  if (snapshot_) { return; }  // a snapshot is the output of an sdk, never a source for one

  snapshot_file_ = ctx.snapshots().build(*this);
  tui::debug("sdk %s snapshot: %s", display_name().c_str(), snapshot_file_->c_str());
}

}  // namespace sdkgraph
