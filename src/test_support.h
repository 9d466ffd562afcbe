#pragma once

// Graph construction helpers for unit tests; declares modules directly, bypassing the
// build file loader.

#include "engine.h"
#include "module_graph.h"
#include "module_types/cc_library.h"
#include "module_types/defaults.h"
#include "module_types/droidstubs.h"
#include "module_types/java_library.h"
#include "module_types/package.h"
#include "sdk.h"
#include "sdk_aware.h"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sdkgraph::test {

struct graph_fixture {
  module_graph graph;

  sdk_module &sdk(std::string name, sdk_properties members, std::string variant = "");
  sdk_module &snapshot(std::string name, sdk_properties members, std::string variant = "");
  cc_library &cc(component_module::props props, std::string variant = "");
  java_library &java(component_module::props props, std::string variant = "");
  droidstubs &stubs(component_module::props props, std::string variant = "");
  package_module &package(package_module::props props, std::string variant = "");
  defaults_module &defaults(defaults_module::props props, std::string variant = "");

  // Throws std::runtime_error if missing.
  module &get(std::string_view name, std::string_view variant = "") const;
  sdk_aware &aware(std::string_view name, std::string_view variant = "") const;

  // "<target display name> <tag>" per edge, in edge order.
  std::vector<std::string> edges_of(std::string_view name,
                                    std::string_view variant = "") const;

  // Pipeline stages, in order.
  void run_pre_deps();
  void run_deps();
  void run_post_deps();

  // Full pipeline with the standard member registry and a path-only snapshot builder.
  build_result run(std::filesystem::path out_dir = "out");

  std::vector<std::string> errors() const;  // diagnostics as strings

 private:
  template <typename T>
  T &add(std::unique_ptr<T> m) {
    auto &result{ *m };
    graph.add(std::move(m));
    return result;
  }
};

}  // namespace sdkgraph::test
