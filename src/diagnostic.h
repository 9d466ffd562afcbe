#pragma once

#include <string>

namespace sdkgraph {

// A user-facing error attributed to one module, and optionally one of its properties.
struct diagnostic {
  std::string module;
  std::string variant;
  std::string property;  // empty for module-level errors
  std::string message;

  // module "mysdk@5": name: sdk shouldn't be named as <name>@<version>.
  // module "myapex" variant "myapex": depends on "libbar" ...
  std::string to_string() const;

  bool operator==(diagnostic const &) const = default;
};

}  // namespace sdkgraph
