#pragma once

#include <string>
#include <variant>

namespace sdkgraph {

struct member_list_property;

namespace dependency_tags {

struct plain {  // ordinary build dependency
  bool operator==(plain const &) const = default;
};

struct stubs {  // links against another package's stubs
  bool operator==(stubs const &) const = default;
};

struct package_contents {  // a package bundles the target
  bool operator==(package_contents const &) const = default;
};

struct defaults {  // inherits properties from a defaults module
  bool operator==(defaults const &) const = default;
};

// From an sdk module to a member named in one of its member lists.
struct sdk_member {
  member_list_property const *property;

  bool operator==(sdk_member const &) const = default;
};

// From an in-development member to a frozen copy of the same member,
// e.g. libfoo -> mysdk_libfoo@11 and mysdk_libfoo@12.
struct versioned_member {
  std::string member;
  std::string version;

  bool operator==(versioned_member const &) const = default;
};

}  // namespace dependency_tags

using dependency_tag = std::variant<dependency_tags::plain,
                                    dependency_tags::stubs,
                                    dependency_tags::package_contents,
                                    dependency_tags::defaults,
                                    dependency_tags::sdk_member,
                                    dependency_tags::versioned_member>;

// "plain", "sdk_member(native_shared_libs)", "versioned_member(libfoo@11)"
std::string dependency_tag_name(dependency_tag const &tag);

// Membership and inter-version edges describe the SDK itself, not a consumer's use of
// a member, so they are never rewired by dependency replacement.
bool dependency_tag_is_sdk_structural(dependency_tag const &tag);

}  // namespace sdkgraph
