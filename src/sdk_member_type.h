#pragma once

#include "dependency_tag.h"

#include <string>
#include <string_view>
#include <vector>

namespace sdkgraph {

class bottom_up_ctx;
class module;

// A kind of module that may be listed as an SDK member.
class sdk_member_type {
 public:
  virtual ~sdk_member_type() = default;

  // Human-readable kind used in errors, e.g. "native library".
  virtual std::string_view name() const = 0;

  // Add an edge tagged `tag` from the sdk in `ctx` to each listed module.
  virtual void add_dependencies(bottom_up_ctx &ctx,
                                dependency_tag const &tag,
                                std::vector<std::string> const &names) const = 0;

  virtual bool is_instance(module const &m) const = 0;
};

}  // namespace sdkgraph
