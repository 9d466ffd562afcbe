#pragma once

#include "module.h"
#include "sol_util.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sdkgraph {

// Builds one module for one variant from its build-file property table.
using module_factory_t =
    std::function<std::unique_ptr<module>(sol::table const &props, std::string variant)>;

class module_type_registry {
 public:
  // Throws std::logic_error on a duplicate name.
  void register_type(std::string name, module_factory_t factory);

  module_factory_t const *find(std::string_view name) const;
  std::vector<std::string> type_names() const;

  // sdk, sdk_snapshot, cc_library, java_library, droidstubs, package, defaults
  static module_type_registry const &standard();

 private:
  std::map<std::string, module_factory_t, std::less<>> factories_;
};

}  // namespace sdkgraph
