#pragma once

#include "module.h"
#include "module_type_registry.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sdkgraph {

class module_graph;

constexpr std::string_view kBuildFileName{ "sdkgraph.lua" };

// Header directives, e.g. -- @sdkgraph out-dir "out/sdk"
struct build_file_meta {
  std::optional<std::string> out_dir;
};

build_file_meta parse_build_file_meta(std::string_view content);

// A Lua build description. Each module type is a global function taking a property
// table; every call declares one module, instantiated once per variant:
//
//   DEFAULT_VARIANTS = { "myapex", "otherapex" }
//   sdk { name = "mysdk", native_shared_libs = { "libfoo" } }
//   cc_library { name = "libfoo", variants = { "myapex" } }
struct build_file : unmovable {
  std::filesystem::path path;
  build_file_meta meta;
  std::vector<std::string> default_variants;
  std::vector<std::unique_ptr<module>> modules;  // declaration order, variants adjacent

  build_file() = default;

  // Use provided path if given, otherwise discover from the current directory. Returns
  // an absolute path or throws if not found.
  static std::filesystem::path find_path(
      std::optional<std::filesystem::path> const &explicit_path);

  // Walks up from the current directory; stops at a directory containing .git.
  static std::optional<std::filesystem::path> discover();

  static std::unique_ptr<build_file> load(
      std::filesystem::path const &path,
      module_type_registry const &types = module_type_registry::standard());
  static std::unique_ptr<build_file> load(
      std::vector<unsigned char> const &content,
      std::filesystem::path const &path,
      module_type_registry const &types = module_type_registry::standard());
  static std::unique_ptr<build_file> load(
      char const *script,
      std::filesystem::path const &path,
      module_type_registry const &types = module_type_registry::standard());

  // Moves every module into `graph`. Throws on a duplicate (name, variant).
  void populate(module_graph &graph);
};

}  // namespace sdkgraph
