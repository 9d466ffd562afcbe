#include "member_types.h"

#include "module.h"
#include "mutator_ctx.h"

#include <utility>

namespace sdkgraph {

module_type_member_type::module_type_member_type(std::string name, std::string module_type)
    : name_{ std::move(name) }, module_type_{ std::move(module_type) } {}

void module_type_member_type::add_dependencies(bottom_up_ctx &ctx,
                                               dependency_tag const &tag,
                                               std::vector<std::string> const &names) const {
  ctx.add_dependencies(tag, names);
}

bool module_type_member_type::is_instance(module const &m) const {
  return m.type_name() == module_type_;
}

sdk_member_type const &cc_library_sdk_member_type() {
  static module_type_member_type const type{ "native library", "cc_library" };
  return type;
}

sdk_member_type const &java_header_library_sdk_member_type() {
  static module_type_member_type const type{ "java header library", "java_library" };
  return type;
}

sdk_member_type const &java_impl_library_sdk_member_type() {
  static module_type_member_type const type{ "java library", "java_library" };
  return type;
}

sdk_member_type const &droidstubs_sdk_member_type() {
  static module_type_member_type const type{ "stubs source", "droidstubs" };
  return type;
}

}  // namespace sdkgraph
