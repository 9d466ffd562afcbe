#pragma once

#include "sdk_member_type.h"

#include <string>
#include <string_view>
#include <vector>

namespace sdkgraph {

// Member type satisfied by modules of one module type.
class module_type_member_type : public sdk_member_type {
 public:
  module_type_member_type(std::string name, std::string module_type);

  std::string_view name() const override { return name_; }
  void add_dependencies(bottom_up_ctx &ctx,
                        dependency_tag const &tag,
                        std::vector<std::string> const &names) const override;
  bool is_instance(module const &m) const override;

 private:
  std::string const name_;
  std::string const module_type_;
};

sdk_member_type const &cc_library_sdk_member_type();
sdk_member_type const &java_header_library_sdk_member_type();
sdk_member_type const &java_impl_library_sdk_member_type();
sdk_member_type const &droidstubs_sdk_member_type();

}  // namespace sdkgraph
