#pragma once

#include "member_list_registry.h"
#include "mutator_registry.h"

namespace sdkgraph {

class bottom_up_ctx;
class top_down_ctx;

// SdkMember, SdkMember_deps, SdkMemberInterVersion
void register_sdk_pre_deps_mutators(register_mutators_ctx &ctx,
                                    member_list_registry const &members);

// SdkDepsMutator, SdkDepsReplaceMutator, SdkRequirementCheck. Must be registered after
// whatever sets the initial required sdks of consumers.
void register_sdk_post_deps_mutators(register_mutators_ctx &ctx);

// Individual passes

// Edges from each sdk to the modules named in its member lists.
void sdk_member_mutator(bottom_up_ctx &ctx, member_list_registry const &members);

// Validates the sdk name against its kind and records membership on each member.
void sdk_member_deps_mutator(top_down_ctx &ctx);

// Edges from the in-development member to each versioned copy of it.
void sdk_member_inter_version_mutator(bottom_up_ctx &ctx);

// Pushes required sdks down to sdk-aware dependencies.
void sdk_deps_mutator(top_down_ctx &ctx);

// Points consumers that require a versioned sdk at the member copy from that version.
void sdk_deps_replace_mutator(bottom_up_ctx &ctx);

// Reports dependencies whose sdk is not one the module requires.
void sdk_requirements_mutator(top_down_ctx &ctx);

}  // namespace sdkgraph
