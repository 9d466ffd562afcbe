#include "engine.h"

#include "build_file.h"
#include "member_list_registry.h"
#include "module_graph.h"
#include "sdk_aware.h"
#include "snapshot_builder.h"

#include "doctest.h"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sdkgraph {

namespace {

// Loads a script into a fresh graph and runs every pass over it.
struct resolved {
  module_graph graph;
  build_result result;

  explicit resolved(char const *script, std::filesystem::path out_dir = "out") {
    build_file::load(script, "sdkgraph.lua")->populate(graph);
    output_dir_snapshot_builder const snapshots{ std::move(out_dir) };
    engine eng{ graph, member_list_registry::standard(), snapshots };
    result = eng.run();
  }

  std::vector<std::string> errors() const {
    std::vector<std::string> out;
    for (auto const &d : result.diagnostics) { out.push_back(d.to_string()); }
    return out;
  }

  std::vector<std::string> targets_of(std::string_view name, std::string_view variant) const {
    std::vector<std::string> out;
    for (auto const &dep : graph.find(name, variant)->dependencies()) {
      out.push_back(dep.target->display_name());
    }
    return out;
  }
};

constexpr char const *kPinnedApex{ R"(
DEFAULT_VARIANTS = { "myapex", "otherapex" }

sdk { name = "mysdk", native_shared_libs = { "libfoo" } }
sdk_snapshot { name = "mysdk@11", native_shared_libs = { "mysdk_libfoo@11" } }
cc_library { name = "libfoo" }
cc_library { name = "mysdk_libfoo@11", sdk_member_name = "libfoo" }

package {
  name = "myapex",
  variants = { "myapex" },
  native_shared_libs = { "libfoo" },
  uses_sdks = { "mysdk@11" },
}
package {
  name = "otherapex",
  variants = { "otherapex" },
  native_shared_libs = { "libfoo" },
}
)" };

}  // namespace

TEST_CASE("engine pins a package to a versioned sdk member") {
  resolved const r{ kPinnedApex };

  CHECK(r.result.ok());
  CHECK(r.targets_of("myapex", "myapex") ==
        std::vector<std::string>{ "mysdk_libfoo@11 [myapex]" });
  CHECK(r.targets_of("otherapex", "otherapex") ==
        std::vector<std::string>{ "libfoo [otherapex]" });

  auto const *pinned{ r.graph.find("mysdk_libfoo@11", "myapex")->as_sdk_aware() };
  REQUIRE(pinned);
  CHECK(pinned->contained_sdk().to_string() == "mysdk@11");
  CHECK(pinned->required_sdks().to_string() == "[mysdk@11]");

  auto const *unpinned{ r.graph.find("mysdk_libfoo@11", "otherapex")->as_sdk_aware() };
  REQUIRE(unpinned);
  CHECK(unpinned->required_sdks().empty());
}

TEST_CASE("engine reports snapshot paths for in-development sdks") {
  resolved const r{ kPinnedApex, "gen" };

  REQUIRE(r.result.ok());
  REQUIRE(r.result.snapshots.size() == 2);
  CHECK(r.result.snapshots[0].sdk == "mysdk");
  CHECK(r.result.snapshots[0].variant == "myapex");
  CHECK(r.result.snapshots[0].file ==
        std::filesystem::path{ "gen/mysdk/myapex/mysdk-current.zip" });
  CHECK(r.result.snapshots[1].variant == "otherapex");
  CHECK(r.result.snapshots[1].file ==
        std::filesystem::path{ "gen/mysdk/otherapex/mysdk-current.zip" });
}

TEST_CASE("engine skips build actions when any module fails") {
  resolved const r{ R"(
sdk { name = "mysdk", native_shared_libs = { "libfoo" } }
sdk { name = "brokensdk@5" }
cc_library { name = "libfoo" }
)" };

  CHECK_FALSE(r.result.ok());
  CHECK(r.result.snapshots.empty());
  CHECK(r.errors() == std::vector<std::string>{
                          "module \"brokensdk@5\": name: sdk shouldn't be named as "
                          "<name>@<version>." });
  CHECK_FALSE(r.graph.find("mysdk", "")->as_sdk()->snapshot_file().has_value());
}

TEST_CASE("engine reports requirement violations with variants") {
  resolved const r{ R"(
DEFAULT_VARIANTS = { "myapex" }
sdk { name = "mysdk", native_shared_libs = { "libbar" } }
sdk_snapshot { name = "mysdk@12", native_shared_libs = { "mysdk_libbar@12" } }
cc_library { name = "libbar" }
cc_library { name = "mysdk_libbar@12", sdk_member_name = "libbar" }
package { name = "myapex", deps = { "mysdk_libbar@12" }, uses_sdks = { "mysdk@11" } }
)" };

  CHECK(r.errors() == std::vector<std::string>{
                          "module \"myapex\" variant \"myapex\": depends on "
                          "\"mysdk_libbar@12\" (in SDK \"mysdk@12\") that isn't part of the "
                          "required SDKs: [mysdk@11]" });
}

TEST_CASE("engine applies defaults before requirement checks") {
  resolved const r{ R"(
defaults { name = "common_deps", deps = { "libshared" }, stub_deps = { "libplatform" } }
cc_library { name = "libfoo", defaults = { "common_deps" } }
cc_library { name = "libshared" }
cc_library { name = "libplatform" }
package { name = "myapex", native_shared_libs = { "libfoo" }, uses_sdks = { "mysdk@1" } }
)" };

  CHECK(r.targets_of("libfoo", "") ==
        std::vector<std::string>{ "common_deps", "libshared", "libplatform" });
  CHECK(r.errors() == std::vector<std::string>{
                          "module \"libfoo\": depends on \"libplatform\" (not in any SDK) that "
                          "isn't part of the required SDKs: [mysdk@1]" });
}

TEST_CASE("engine rejects a non-defaults module in defaults") {
  resolved const r{ R"(
cc_library { name = "libfoo", defaults = { "libbar" } }
cc_library { name = "libbar" }
)" };

  CHECK(r.errors() == std::vector<std::string>{
                          "module \"libfoo\": defaults: module \"libbar\" is not a defaults "
                          "module" });
}

TEST_CASE("engine resolves java and stubs members") {
  resolved const r{ R"(
sdk {
  name = "mysdk",
  java_header_libs = { "framework-headers" },
  java_libs = { "framework" },
  stubs_sources = { "framework-stubs" },
}
java_library { name = "framework-headers" }
java_library { name = "framework", libs = { "framework-headers" } }
droidstubs { name = "framework-stubs" }
)" };

  CHECK(r.result.ok());
  for (auto const *name : { "framework-headers", "framework", "framework-stubs" }) {
    CAPTURE(name);
    CHECK(r.graph.find(name, "")->as_sdk_aware()->contained_sdk().to_string() == "mysdk");
  }
}

TEST_CASE("engine rejects members of the wrong kind") {
  resolved const r{ R"(
sdk { name = "mysdk", java_libs = { "libfoo" }, stubs_sources = { "framework" } }
cc_library { name = "libfoo" }
java_library { name = "framework" }
)" };

  CHECK(r.errors() == std::vector<std::string>{
                          "module \"mysdk\": java_libs: module \"libfoo\" is not a java "
                          "library",
                          "module \"mysdk\": stubs_sources: module \"framework\" is not a "
                          "stubs source" });
}

TEST_CASE("engine throws on dependency cycles") {
  module_graph graph;
  build_file::load(R"(
cc_library { name = "a", deps = { "b" } }
cc_library { name = "b", deps = { "a" } }
)",
                   "sdkgraph.lua")
      ->populate(graph);

  output_dir_snapshot_builder const snapshots{ "out" };
  engine eng{ graph, member_list_registry::standard(), snapshots };
  CHECK_THROWS_WITH_AS(eng.run(), "Cycle detected: a -> b -> a", std::runtime_error);
}

}  // namespace sdkgraph
