#include "mutator_registry.h"

#include <stdexcept>
#include <utility>

namespace sdkgraph {

namespace {

void check_registration(std::string const &name, bool has_fn) {
  if (name.empty()) { throw std::logic_error("mutator registered without a name"); }
  if (!has_fn) { throw std::logic_error("mutator " + name + " registered without a body"); }
}

}  // namespace

mutator_registration &register_mutators_ctx::top_down(std::string name,
                                                      top_down_mutator_t fn) {
  check_registration(name, static_cast<bool>(fn));
  return mutators_.emplace_back(
      mutator_registration{ .name = std::move(name), .fn = std::move(fn) });
}

mutator_registration &register_mutators_ctx::bottom_up(std::string name,
                                                       bottom_up_mutator_t fn) {
  check_registration(name, static_cast<bool>(fn));
  return mutators_.emplace_back(
      mutator_registration{ .name = std::move(name), .fn = std::move(fn) });
}

}  // namespace sdkgraph
