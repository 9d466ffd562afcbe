#include "snapshot_builder.h"

#include "sdk.h"
#include "sdk_ref.h"

#include <string>
#include <utility>

namespace sdkgraph {

output_dir_snapshot_builder::output_dir_snapshot_builder(std::filesystem::path out_dir)
    : out_dir_{ std::move(out_dir) } {}

std::filesystem::path output_dir_snapshot_builder::build(sdk_module const &sdk) const {
  auto dir{ out_dir_ / sdk.name() };
  if (!sdk.variant().empty()) { dir /= sdk.variant(); }
  return dir / (sdk.name() + "-" + std::string{ kSdkVersionCurrent } + ".zip");
}

}  // namespace sdkgraph
