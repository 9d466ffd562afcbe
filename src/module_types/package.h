#pragma once

#include "module.h"
#include "mutator_registry.h"
#include "sdk_aware.h"
#include "sol_util.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sdkgraph {

// A deployable bundle. Its contents ship inside it; everything else it depends on is
// external and must come from one of the sdks named in uses_sdks.
class package_module : public module, public sdk_base, public package_checker {
 public:
  struct props {
    std::string name;
    std::vector<std::string> native_shared_libs;
    std::vector<std::string> java_libs;
    std::vector<std::string> deps;
    std::vector<std::string> uses_sdks;
    std::vector<std::string> defaults;
  };

  package_module(props p, std::string variant);

  static std::unique_ptr<module> create(sol::table const &table, std::string variant);

  std::string_view type_name() const override { return "package"; }
  sdk_aware *as_sdk_aware() override { return this; }
  package_checker const *as_package_checker() const override { return this; }
  package_module *as_package() override { return this; }

  void declare_deps(bottom_up_ctx &ctx) override;
  bool dep_is_in_same_package(module const &dep, dependency_tag const &tag) const override;

  props const &properties() const { return props_; }

 private:
  props props_;
};

// Seeds each package's required sdks from uses_sdks.
void package_uses_sdks_mutator(bottom_up_ctx &ctx);

// PackageUsesSdks; register before the sdk post-deps mutators.
void register_package_post_deps_mutators(register_mutators_ctx &ctx);

}  // namespace sdkgraph
