#pragma once

#include <deque>
#include <functional>
#include <string>
#include <variant>

namespace sdkgraph {

class bottom_up_ctx;
class top_down_ctx;

using top_down_mutator_t = std::function<void(top_down_ctx &)>;
using bottom_up_mutator_t = std::function<void(bottom_up_ctx &)>;

struct mutator_registration {
  std::string name;
  std::variant<top_down_mutator_t, bottom_up_mutator_t> fn;
  bool run_parallel{ false };

  // Visit independent modules concurrently, honoring traversal order.
  mutator_registration &parallel() {
    run_parallel = true;
    return *this;
  }
};

// Ordered list of named passes for one graph phase.
class register_mutators_ctx {
 public:
  mutator_registration &top_down(std::string name, top_down_mutator_t fn);
  mutator_registration &bottom_up(std::string name, bottom_up_mutator_t fn);

  std::deque<mutator_registration> const &mutators() const { return mutators_; }

 private:
  std::deque<mutator_registration> mutators_;  // deque keeps returned references valid
};

}  // namespace sdkgraph
