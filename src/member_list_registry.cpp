#include "member_list_registry.h"

#include "module_types/member_types.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace sdkgraph {

member_list_registry::member_list_registry(std::vector<member_list_property> properties)
    : properties_{ std::move(properties) } {
  for (auto &property : properties_) {
    if (!property.getter || !property.member_type) {
      throw std::logic_error("member list property " + property.name +
                             " has no getter or member type");
    }
    property.tag = dependency_tags::sdk_member{ .property = &property };
  }
}

member_list_registry const &member_list_registry::standard() {
  static member_list_registry const registry{ std::vector<member_list_property>{
      { .name = "native_shared_libs",
        .getter = [](sdk_properties const &p) -> std::vector<std::string> const & {
          return p.native_shared_libs;
        },
        .member_type = &cc_library_sdk_member_type() },
      { .name = "java_header_libs",
        .getter = [](sdk_properties const &p) -> std::vector<std::string> const & {
          return p.java_header_libs;
        },
        .member_type = &java_header_library_sdk_member_type() },
      { .name = "java_libs",
        .getter = [](sdk_properties const &p) -> std::vector<std::string> const & {
          return p.java_libs;
        },
        .member_type = &java_impl_library_sdk_member_type() },
      { .name = "stubs_sources",
        .getter = [](sdk_properties const &p) -> std::vector<std::string> const & {
          return p.stubs_sources;
        },
        .member_type = &droidstubs_sdk_member_type() },
  } };
  return registry;
}

member_list_property const *member_list_registry::find(std::string_view name) const {
  auto const it{ std::ranges::find_if(properties_,
                                      [&](auto const &p) { return p.name == name; }) };
  return it == properties_.end() ? nullptr : &*it;
}

}  // namespace sdkgraph
