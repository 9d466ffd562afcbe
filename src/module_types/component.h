#pragma once

#include "module.h"
#include "sdk_aware.h"
#include "sol_util.h"

#include <string>
#include <string_view>
#include <vector>

namespace sdkgraph {

// A buildable unit that can be an sdk member: cc_library, java_library, droidstubs.
// Plain dependencies are bundled with it; stub dependencies are not.
class component_module : public module, public sdk_base, public package_checker {
 public:
  struct props {
    std::string name;
    std::string sdk_member_name;  // defaults to name
    std::vector<std::string> deps;
    std::vector<std::string> stub_deps;
    std::vector<std::string> defaults;
  };

  sdk_aware *as_sdk_aware() override { return this; }
  package_checker const *as_package_checker() const override { return this; }

  void declare_deps(bottom_up_ctx &ctx) override;
  bool dep_is_in_same_package(module const &dep, dependency_tag const &tag) const override;

  props const &properties() const { return props_; }

 protected:
  component_module(props p, std::string variant);

  // name and sdk_member_name; dependency lists are left for the module type to read.
  static props parse_common_props(sol::table const &table, std::string_view context);

 private:
  props props_;
};

}  // namespace sdkgraph
