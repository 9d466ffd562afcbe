#include "diagnostic.h"

#include "util.h"

namespace sdkgraph {

std::string diagnostic::to_string() const {
  std::string result{ "module " + util_quote(module) };
  if (!variant.empty()) { result += " variant " + util_quote(variant); }
  result += ": ";
  if (!property.empty()) { result += property + ": "; }
  result += message;
  return result;
}

}  // namespace sdkgraph
