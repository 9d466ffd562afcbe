#pragma once

#include "dependency_tag.h"
#include "util.h"

#include <string>
#include <string_view>
#include <vector>

namespace sdkgraph {

class sdk_member_type;

// Member lists declared on an sdk or sdk_snapshot module.
struct sdk_properties {
  std::vector<std::string> java_header_libs;
  std::vector<std::string> java_libs;
  std::vector<std::string> native_shared_libs;
  std::vector<std::string> stubs_sources;
};

struct member_list_property {
  using getter_t = std::vector<std::string> const &(*)(sdk_properties const &);

  std::string name;  // property name in build files, e.g. "native_shared_libs"
  getter_t getter;
  sdk_member_type const *member_type;
  dependency_tags::sdk_member tag{};  // bound to this entry by member_list_registry
};

// Fixed table of member-list properties. Built once, never mutated afterwards, and
// passed by reference to every pass that needs it.
class member_list_registry : unmovable {
 public:
  explicit member_list_registry(std::vector<member_list_property> properties);

  // native_shared_libs, java_header_libs, java_libs, stubs_sources
  static member_list_registry const &standard();

  std::vector<member_list_property> const &properties() const { return properties_; }
  member_list_property const *find(std::string_view name) const;

 private:
  std::vector<member_list_property> properties_;
};

}  // namespace sdkgraph
