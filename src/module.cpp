#include "module.h"

#include <utility>

namespace sdkgraph {

module::module(std::string name, std::string variant)
    : name_{ std::move(name) }, variant_{ std::move(variant) } {}

std::string module::display_name() const {
  if (variant_.empty()) { return name_; }
  return name_ + " [" + variant_ + "]";
}

}  // namespace sdkgraph
