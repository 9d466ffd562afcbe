#pragma once

#include "module.h"
#include "sol_util.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sdkgraph {

// Shared dependency lists, inherited by modules that name it in `defaults`.
class defaults_module : public module, public defaults_provider {
 public:
  struct props {
    std::string name;
    std::vector<std::string> deps;
    std::vector<std::string> stub_deps;
  };

  defaults_module(props p, std::string variant);

  static std::unique_ptr<module> create(sol::table const &table, std::string variant);

  std::string_view type_name() const override { return "defaults"; }
  defaults_provider const *as_defaults_provider() const override { return this; }

  std::vector<std::string> const &inherited_deps() const override { return props_.deps; }
  std::vector<std::string> const &inherited_stub_deps() const override {
    return props_.stub_deps;
  }

 private:
  props props_;
};

}  // namespace sdkgraph
