#pragma once

#include "member_list_registry.h"
#include "module.h"
#include "sol_util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sdkgraph {

// "sdk" groups members under an in-development name ("mysdk"); "sdk_snapshot" is a
// frozen copy named <name>@<version> ("mysdk@11").
class sdk_module : public module {
 public:
  struct props {
    std::string name;
    sdk_properties members;
  };

  sdk_module(props p, std::string variant, bool snapshot);

  static props parse_props(sol::table const &table, std::string_view context);

  static std::unique_ptr<module> create_sdk(sol::table const &table, std::string variant);
  static std::unique_ptr<module> create_snapshot(sol::table const &table, std::string variant);

  std::string_view type_name() const override { return snapshot_ ? "sdk_snapshot" : "sdk"; }
  sdk_module *as_sdk() override { return this; }

  void generate_build_actions(build_ctx &ctx) override;

  bool snapshot() const { return snapshot_; }
  sdk_properties const &members() const { return props_.members; }

  // Set by generate_build_actions for non-snapshot sdks only.
  std::optional<std::filesystem::path> const &snapshot_file() const { return snapshot_file_; }

 private:
  props props_;
  bool const snapshot_;
  std::optional<std::filesystem::path> snapshot_file_;
};

}  // namespace sdkgraph
