#include "sdk_aware.h"

#include <utility>

namespace sdkgraph {

sdk_base::sdk_base(std::string member_name) : member_name_{ std::move(member_name) } {}

sdk_ref sdk_base::contained_sdk() const {
  std::lock_guard lock{ mutex_ };
  return contained_sdk_;
}

std::optional<sdk_ref> sdk_base::make_member_of(sdk_ref const &sdk) {
  std::lock_guard lock{ mutex_ };
  if (contained_sdk_.is_set() && contained_sdk_ != sdk) { return contained_sdk_; }
  contained_sdk_ = sdk;
  return std::nullopt;
}

sdk_refs sdk_base::required_sdks() const {
  std::lock_guard lock{ mutex_ };
  return required_sdks_;
}

bool sdk_base::build_with_sdks(sdk_refs const &sdks) {
  std::lock_guard lock{ mutex_ };
  return required_sdks_.add_all(sdks);
}

}  // namespace sdkgraph
