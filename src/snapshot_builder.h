#pragma once

#include <filesystem>

namespace sdkgraph {

class sdk_module;

// Produces the snapshot artifact of an in-development sdk and returns its path.
class snapshot_builder {
 public:
  virtual ~snapshot_builder() = default;
  virtual std::filesystem::path build(sdk_module const &sdk) const = 0;
};

// <out_dir>/<sdk>[/<variant>]/<sdk>-current.zip. Only names the artifact; packaging the
// member outputs is left to the build that consumes the path.
class output_dir_snapshot_builder : public snapshot_builder {
 public:
  explicit output_dir_snapshot_builder(std::filesystem::path out_dir);

  std::filesystem::path build(sdk_module const &sdk) const override;

 private:
  std::filesystem::path out_dir_;
};

}  // namespace sdkgraph
