#pragma once

#include "dependency_tag.h"
#include "util.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sdkgraph {

class bottom_up_ctx;
class build_ctx;
class module;
class package_checker;
class package_module;
class sdk_aware;
class sdk_module;

struct dependency {
  module *target;
  dependency_tag tag;
};

// Modules that only exist to be inherited from expose the lists they contribute.
class defaults_provider {
 public:
  virtual ~defaults_provider() = default;
  virtual std::vector<std::string> const &inherited_deps() const = 0;
  virtual std::vector<std::string> const &inherited_stub_deps() const = 0;
};

// A node in the module graph: one declared module in one variant (build configuration).
// Edges are owned and mutated by module_graph only.
class module : unmovable {
 public:
  virtual ~module() = default;

  std::string const &name() const { return name_; }
  std::string const &variant() const { return variant_; }
  std::string display_name() const;  // "libfoo" or "libfoo [myapex]"
  virtual std::string_view type_name() const = 0;

  // Capabilities; nullptr when the module does not participate.
  virtual sdk_aware *as_sdk_aware() { return nullptr; }
  virtual package_checker const *as_package_checker() const { return nullptr; }
  virtual sdk_module *as_sdk() { return nullptr; }
  virtual package_module *as_package() { return nullptr; }
  virtual defaults_provider const *as_defaults_provider() const { return nullptr; }

  // Deps phase: add the dependencies this module declares.
  virtual void declare_deps(bottom_up_ctx &) {}

  // Runs once all mutators completed without errors.
  virtual void generate_build_actions(build_ctx &) {}

  std::vector<dependency> const &dependencies() const { return deps_; }
  bool failed() const { return failed_; }

 protected:
  module(std::string name, std::string variant);

 private:
  friend class module_graph;

  std::string name_;
  std::string variant_;
  std::vector<dependency> deps_;
  std::size_t index_{ 0 };  // position in module_graph, assigned on add
  bool failed_{ false };
};

}  // namespace sdkgraph
