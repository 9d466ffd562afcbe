#pragma once

#include "dependency_tag.h"
#include "sdk_ref.h"

#include <mutex>
#include <optional>
#include <string>

namespace sdkgraph {

class module;

// Capability of modules that can be SDK members or consumers of versioned SDKs.
// Passes may call these concurrently on the same module.
class sdk_aware {
 public:
  virtual ~sdk_aware() = default;

  // Name of the in-development member this module is, or freezes a copy of.
  virtual std::string member_name() const = 0;

  // Unset (is_set() == false) until assigned.
  virtual sdk_ref contained_sdk() const = 0;
  bool is_in_any_sdk() const { return contained_sdk().is_set(); }

  // Record membership. Returns the previously recorded sdk if a different one already
  // claimed this module; the module is left unchanged in that case.
  virtual std::optional<sdk_ref> make_member_of(sdk_ref const &sdk) = 0;

  virtual sdk_refs required_sdks() const = 0;

  // Union `sdks` into the required set. Returns true if the set grew.
  virtual bool build_with_sdks(sdk_refs const &sdks) = 0;
};

// Whether a dependency ends up in the same distributable package as the module.
class package_checker {
 public:
  virtual ~package_checker() = default;
  virtual bool dep_is_in_same_package(module const &dep, dependency_tag const &tag) const = 0;
};

// Reusable sdk_aware state, one lock per module.
class sdk_base : public sdk_aware {
 public:
  explicit sdk_base(std::string member_name);

  std::string member_name() const override { return member_name_; }
  sdk_ref contained_sdk() const override;
  std::optional<sdk_ref> make_member_of(sdk_ref const &sdk) override;
  sdk_refs required_sdks() const override;
  bool build_with_sdks(sdk_refs const &sdks) override;

 private:
  std::string const member_name_;
  mutable std::mutex mutex_;
  sdk_ref contained_sdk_;
  sdk_refs required_sdks_;
};

}  // namespace sdkgraph
