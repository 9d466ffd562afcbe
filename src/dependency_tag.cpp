#include "dependency_tag.h"

#include "member_list_registry.h"
#include "util.h"

namespace sdkgraph {

std::string dependency_tag_name(dependency_tag const &tag) {
  return std::visit(
      match{
          [](dependency_tags::plain const &) -> std::string { return "plain"; },
          [](dependency_tags::stubs const &) -> std::string { return "stubs"; },
          [](dependency_tags::package_contents const &) -> std::string {
            return "package_contents";
          },
          [](dependency_tags::defaults const &) -> std::string { return "defaults"; },
          [](dependency_tags::sdk_member const &t) -> std::string {
            return "sdk_member(" + (t.property ? t.property->name : std::string{}) + ")";
          },
          [](dependency_tags::versioned_member const &t) -> std::string {
            return "versioned_member(" + t.member + "@" + t.version + ")";
          },
      },
      tag);
}

bool dependency_tag_is_sdk_structural(dependency_tag const &tag) {
  return std::holds_alternative<dependency_tags::sdk_member>(tag) ||
         std::holds_alternative<dependency_tags::versioned_member>(tag);
}

}  // namespace sdkgraph
