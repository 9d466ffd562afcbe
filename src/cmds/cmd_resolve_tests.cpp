#include "cmds/cmd_resolve.h"

#include "build_file.h"
#include "engine.h"
#include "member_list_registry.h"
#include "module_graph.h"
#include "snapshot_builder.h"

#include "doctest.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace sdkgraph {

namespace {

struct temp_build_file {
  std::filesystem::path dir;
  std::filesystem::path path;

  explicit temp_build_file(std::string const &content)
      : dir{ std::filesystem::temp_directory_path() / "sdkgraph-cmd-resolve-test" },
        path{ dir / kBuildFileName } {
    std::filesystem::create_directories(dir);
    std::ofstream out{ path };
    out << content;
  }

  ~temp_build_file() {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }
};

}  // namespace

TEST_CASE("cmd_resolve succeeds on a consistent build file") {
  temp_build_file const bf{ R"(
sdk { name = "mysdk", native_shared_libs = { "libfoo" } }
cc_library { name = "libfoo" }
)" };

  cmd_resolve::cfg cfg;
  cfg.build_file = bf.path;
  cfg.out_dir = bf.dir / "gen";
  cmd_resolve cmd{ cfg };
  CHECK(cmd.execute());
}

TEST_CASE("cmd_resolve fails when the graph has errors") {
  temp_build_file const bf{ R"(
sdk { name = "mysdk", native_shared_libs = { "libmissing" } }
)" };

  cmd_resolve::cfg cfg;
  cfg.build_file = bf.path;
  cmd_resolve cmd{ cfg };
  CHECK_FALSE(cmd.execute());
}

TEST_CASE("cmd_resolve propagates build file errors") {
  temp_build_file const bf{ "cc_library { name = \"libfoo\", bogus = true }\n" };

  cmd_resolve::cfg cfg;
  cfg.build_file = bf.path;
  cmd_resolve cmd{ cfg };
  CHECK_THROWS_AS(cmd.execute(), std::runtime_error);
}

TEST_CASE("cmd_resolve format_graph lists sdk state and edges") {
  module_graph graph;
  build_file::load(R"(
sdk { name = "mysdk", native_shared_libs = { "libfoo" } }
cc_library { name = "libfoo" }
package { name = "myapex", native_shared_libs = { "libfoo" }, uses_sdks = { "mysdk@current" } }
)",
                   "sdkgraph.lua")
      ->populate(graph);

  output_dir_snapshot_builder const snapshots{ "out" };
  engine eng{ graph, member_list_registry::standard(), snapshots };
  auto const result{ eng.run() };

  CHECK(result.ok());
  CHECK(cmd_resolve::format_graph(graph) ==
        "mysdk (sdk)\n"
        "  -> libfoo [sdk_member(native_shared_libs)]\n"
        "libfoo (cc_library)\n"
        "  sdk: mysdk\n"
        "  required_sdks: [mysdk@current]\n"
        "myapex (package)\n"
        "  required_sdks: [mysdk@current]\n"
        "  -> libfoo [package_contents]\n");
}

}  // namespace sdkgraph
