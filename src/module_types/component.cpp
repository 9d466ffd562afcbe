#include "component.h"

#include "mutator_ctx.h"

#include <utility>

namespace sdkgraph {

component_module::component_module(props p, std::string variant)
    : module{ p.name, std::move(variant) },
      sdk_base{ p.sdk_member_name.empty() ? p.name : p.sdk_member_name },
      props_{ std::move(p) } {}

component_module::props component_module::parse_common_props(sol::table const &table,
                                                              std::string_view context) {
  return props{
    .name = sol_util_get_required<std::string>(table, "name", context),
    .sdk_member_name =
        sol_util_get_or_default<std::string>(table, "sdk_member_name", "", context),
    .deps = {},
    .stub_deps = {},
    .defaults = {},
  };
}

void component_module::declare_deps(bottom_up_ctx &ctx) {
  auto deps{ props_.deps };
  auto stub_deps{ props_.stub_deps };

  for (auto const &name : props_.defaults) {
    auto const *target{ ctx.find_module(name) };
    if (!target) { continue; }  // reported by add_dependencies below

    auto const *provider{ target->as_defaults_provider() };
    if (!provider) {
      ctx.property_error("defaults", "module " + util_quote(name) + " is not a defaults module");
      continue;
    }
    deps.insert(deps.end(), provider->inherited_deps().begin(), provider->inherited_deps().end());
    stub_deps.insert(stub_deps.end(),
                     provider->inherited_stub_deps().begin(),
                     provider->inherited_stub_deps().end());
  }

  ctx.add_dependencies(dependency_tags::defaults{}, props_.defaults);
  ctx.add_dependencies(dependency_tags::plain{}, deps);
  ctx.add_dependencies(dependency_tags::stubs{}, stub_deps);
}

bool component_module::dep_is_in_same_package(module const &, dependency_tag const &tag) const {
  return !std::holds_alternative<dependency_tags::stubs>(tag);
}

}  // namespace sdkgraph
