#include "sdk_mutators.h"

#include "module.h"
#include "mutator_ctx.h"
#include "sdk.h"
#include "sdk_aware.h"
#include "sdk_member_type.h"
#include "sdk_ref.h"
#include "trace.h"
#include "util.h"

#include <stdexcept>
#include <string>

namespace sdkgraph {

void register_sdk_pre_deps_mutators(register_mutators_ctx &ctx,
                                    member_list_registry const &members) {
  ctx.bottom_up("SdkMember", [&members](bottom_up_ctx &c) { sdk_member_mutator(c, members); })
      .parallel();
  ctx.top_down("SdkMember_deps", sdk_member_deps_mutator).parallel();
  ctx.bottom_up("SdkMemberInterVersion", sdk_member_inter_version_mutator).parallel();
}

void register_sdk_post_deps_mutators(register_mutators_ctx &ctx) {
  ctx.top_down("SdkDepsMutator", sdk_deps_mutator).parallel();
  ctx.bottom_up("SdkDepsReplaceMutator", sdk_deps_replace_mutator).parallel();
  ctx.top_down("SdkRequirementCheck", sdk_requirements_mutator).parallel();
}

void sdk_member_mutator(bottom_up_ctx &ctx, member_list_registry const &members) {
  auto *sdk{ ctx.this_module().as_sdk() };
  if (!sdk) { return; }

  for (auto const &property : members.properties()) {
    auto const &names{ property.getter(sdk->members()) };
    if (names.empty()) { continue; }
    property.member_type->add_dependencies(ctx, property.tag, names);
  }
}

void sdk_member_deps_mutator(top_down_ctx &ctx) {
  auto *sdk{ ctx.this_module().as_sdk() };
  if (!sdk) { return; }

  sdk_ref my_ref;
  try {
    my_ref = sdk_ref::parse(ctx.module_name());
  } catch (std::runtime_error const &e) {
    ctx.property_error("name", e.what());
    return;
  }

  if (sdk->snapshot() && my_ref.unversioned()) {
    ctx.property_error("name",
                       "sdk_snapshot should be named as <name>@<version>. "
                       "Did you manually modify the build file?");
    return;
  }
  if (!sdk->snapshot() && !my_ref.unversioned()) {
    ctx.property_error("name", "sdk shouldn't be named as <name>@<version>.");
    return;
  }

  ctx.visit_direct_deps([&](module &dep, dependency_tag const &tag) {
    auto const *member_tag{ std::get_if<dependency_tags::sdk_member>(&tag) };
    if (!member_tag) { return; }

    auto const &property{ *member_tag->property };
    if (!property.member_type->is_instance(dep)) {
      ctx.property_error(property.name,
                         "module " + util_quote(dep.name()) + " is not a " +
                             std::string{ property.member_type->name() });
      return;
    }

    auto *member{ dep.as_sdk_aware() };
    if (!member) { return; }

    // Settled after the barrier in registration order; the earliest sdk keeps the member.
    ctx.defer([&dep, member, my_ref](module_ctx &c) {
      if (auto const existing{ member->make_member_of(my_ref) }) {
        c.module_error("module " + util_quote(dep.name()) + " is already a member of sdk " +
                       util_quote(existing->to_string()) +
                       "; it cannot also be a member of sdk " +
                       util_quote(my_ref.to_string()));
        return;
      }
      SDKGRAPH_TRACE_MEMBER_ASSIGNED(dep.name(), dep.variant(), my_ref.to_string());
    });
  });
}

void sdk_member_inter_version_mutator(bottom_up_ctx &ctx) {
  auto *member{ ctx.this_module().as_sdk_aware() };
  if (!member) { return; }

  auto const sdk{ member->contained_sdk() };
  if (!sdk.is_set() || sdk.unversioned()) { return; }

  auto const member_name{ member->member_name() };
  if (member_name == ctx.module_name()) {
    ctx.property_error("sdk_member_name",
                       "member of versioned sdk " + util_quote(sdk.to_string()) +
                           " must name the in-development module it is a copy of");
    return;
  }

  ctx.add_reverse_dependency(
      dependency_tags::versioned_member{ .member = member_name, .version = sdk.version },
      member_name);
}

void sdk_deps_mutator(top_down_ctx &ctx) {
  auto *self{ ctx.this_module().as_sdk_aware() };
  if (!self) { return; }

  auto const required{ self->required_sdks() };
  if (required.empty()) { return; }

  ctx.visit_direct_deps([&](module &dep, dependency_tag const &) {
    auto *dep_aware{ dep.as_sdk_aware() };
    if (!dep_aware) { return; }
    if (dep_aware->build_with_sdks(required)) {
      SDKGRAPH_TRACE_REQUIREMENTS_PROPAGATED(ctx.module_name(),
                                             dep.name(),
                                             dep.variant(),
                                             required.to_string());
    }
  });
}

void sdk_deps_replace_mutator(bottom_up_ctx &ctx) {
  auto *self{ ctx.this_module().as_sdk_aware() };
  if (!self) { return; }

  auto const sdk{ self->contained_sdk() };
  if (!sdk.is_set() || sdk.unversioned()) { return; }

  if (!self->required_sdks().contains(sdk)) { return; }

  // Only consumers that themselves require this version are rewired.
  ctx.replace_dependencies(self->member_name(), [sdk](module &dependent) {
    auto *aware{ dependent.as_sdk_aware() };
    return aware && aware->required_sdks().contains(sdk);
  });
}

void sdk_requirements_mutator(top_down_ctx &ctx) {
  auto &m{ ctx.this_module() };
  auto *self{ m.as_sdk_aware() };
  auto const *checker{ m.as_package_checker() };
  if (!self || !checker) { return; }

  auto const required{ self->required_sdks() };
  if (required.empty()) { return; }

  ctx.visit_direct_deps([&](module &dep, dependency_tag const &tag) {
    if (std::holds_alternative<dependency_tags::defaults>(tag)) { return; }

    auto *dep_aware{ dep.as_sdk_aware() };
    if (!dep_aware) { return; }
    if (checker->dep_is_in_same_package(dep, tag)) { return; }

    auto const dep_sdk{ dep_aware->contained_sdk() };
    if (required.contains(dep_sdk)) { return; }

    auto const where{ dep_sdk.is_set() ? "(in SDK " + util_quote(dep_sdk.to_string()) + ")"
                                       : std::string{ "(not in any SDK)" } };
    ctx.module_error("depends on " + util_quote(dep.name()) + " " + where +
                     " that isn't part of the required SDKs: " + required.to_string());
  });
}

}  // namespace sdkgraph
