#include "package.h"

#include "mutator_ctx.h"
#include "sdk_ref.h"

#include <stdexcept>
#include <utility>

namespace sdkgraph {

package_module::package_module(props p, std::string variant)
    : module{ p.name, std::move(variant) }, sdk_base{ p.name }, props_{ std::move(p) } {}

std::unique_ptr<module> package_module::create(sol::table const &table, std::string variant) {
  constexpr std::string_view context{ "package" };
  sol_util_check_keys(table,
                      { "name",
                        "variants",
                        "native_shared_libs",
                        "java_libs",
                        "deps",
                        "uses_sdks",
                        "defaults" },
                      context);

  return std::make_unique<package_module>(
      props{
          .name = sol_util_get_required<std::string>(table, "name", context),
          .native_shared_libs = sol_util_get_string_list(table, "native_shared_libs", context),
          .java_libs = sol_util_get_string_list(table, "java_libs", context),
          .deps = sol_util_get_string_list(table, "deps", context),
          .uses_sdks = sol_util_get_string_list(table, "uses_sdks", context),
          .defaults = sol_util_get_string_list(table, "defaults", context),
      },
      std::move(variant));
}

void package_module::declare_deps(bottom_up_ctx &ctx) {
  auto deps{ props_.deps };
  for (auto const &name : props_.defaults) {
    auto const *target{ ctx.find_module(name) };
    if (!target) { continue; }  // reported by add_dependencies below

    if (auto const *provider{ target->as_defaults_provider() }) {
      deps.insert(deps.end(),
                  provider->inherited_deps().begin(),
                  provider->inherited_deps().end());
    } else {
      ctx.property_error("defaults", "module " + util_quote(name) + " is not a defaults module");
    }
  }

  ctx.add_dependencies(dependency_tags::defaults{}, props_.defaults);
  ctx.add_dependencies(dependency_tags::package_contents{}, props_.native_shared_libs);
  ctx.add_dependencies(dependency_tags::package_contents{}, props_.java_libs);
  ctx.add_dependencies(dependency_tags::plain{}, deps);
}

bool package_module::dep_is_in_same_package(module const &, dependency_tag const &tag) const {
  return std::holds_alternative<dependency_tags::package_contents>(tag);
}

void package_uses_sdks_mutator(bottom_up_ctx &ctx) {
  auto *package{ ctx.this_module().as_package() };
  if (!package) { return; }

  sdk_refs required;
  for (auto const &entry : package->properties().uses_sdks) {
    try {
      required.add(sdk_ref::parse(entry));
    } catch (std::runtime_error const &e) {
      ctx.property_error("uses_sdks", e.what());
    }
  }

  if (!ctx.failed()) { package->build_with_sdks(required); }
}

void register_package_post_deps_mutators(register_mutators_ctx &ctx) {
  ctx.bottom_up("PackageUsesSdks", package_uses_sdks_mutator).parallel();
}

}  // namespace sdkgraph
