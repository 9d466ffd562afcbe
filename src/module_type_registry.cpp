#include "module_type_registry.h"

#include "module_types/cc_library.h"
#include "module_types/defaults.h"
#include "module_types/droidstubs.h"
#include "module_types/java_library.h"
#include "module_types/package.h"
#include "sdk.h"

#include <stdexcept>
#include <utility>

namespace sdkgraph {

void module_type_registry::register_type(std::string name, module_factory_t factory) {
  if (!factory) { throw std::logic_error("module type " + name + " has no factory"); }
  if (!factories_.emplace(name, std::move(factory)).second) {
    throw std::logic_error("module type " + name + " registered twice");
  }
}

module_factory_t const *module_type_registry::find(std::string_view name) const {
  auto const it{ factories_.find(name) };
  return it == factories_.end() ? nullptr : &it->second;
}

std::vector<std::string> module_type_registry::type_names() const {
  std::vector<std::string> result;
  result.reserve(factories_.size());
  for (auto const &[name, factory] : factories_) { result.push_back(name); }
  return result;
}

module_type_registry const &module_type_registry::standard() {
  static module_type_registry const registry{ [] {
    module_type_registry r;
    r.register_type("sdk", sdk_module::create_sdk);
    r.register_type("sdk_snapshot", sdk_module::create_snapshot);
    r.register_type("cc_library", cc_library::create);
    r.register_type("java_library", java_library::create);
    r.register_type("droidstubs", droidstubs::create);
    r.register_type("package", package_module::create);
    r.register_type("defaults", defaults_module::create);
    return r;
  }() };
  return registry;
}

}  // namespace sdkgraph
