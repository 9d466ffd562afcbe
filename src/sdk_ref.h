#pragma once

#include <compare>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sdkgraph {

constexpr char kSdkVersionSeparator{ '@' };
constexpr std::string_view kSdkVersionCurrent{ "current" };

// Returns a description of what is wrong with a version token, or nullopt if the token
// is "current" or a non-negative integer. Shared by every parser of <name>@<version>.
std::optional<std::string> sdk_version_error(std::string_view version);

// Identity of one SDK at one version. An empty version is the in-development copy.
struct sdk_ref {
  std::string name;
  std::string version;

  // "mysdk", "mysdk@11", "mysdk@current"
  // Throws std::runtime_error on empty name, empty version after '@', more than one
  // '@', or a version rejected by sdk_version_error().
  static sdk_ref parse(std::string_view str);

  bool unversioned() const { return version.empty(); }
  bool is_set() const { return !name.empty(); }  // false until assigned to an SDK

  std::string to_string() const;

  bool operator==(sdk_ref const &) const = default;
  auto operator<=>(sdk_ref const &) const = default;
};

// Ordered set of references; preserves first-insertion order for stable messages.
class sdk_refs {
 public:
  sdk_refs() = default;
  sdk_refs(std::initializer_list<sdk_ref> refs);

  bool contains(sdk_ref const &ref) const;

  // Returns true if the set grew.
  bool add(sdk_ref ref);
  bool add_all(sdk_refs const &other);

  bool empty() const { return refs_.empty(); }
  std::size_t size() const { return refs_.size(); }
  auto begin() const { return refs_.begin(); }
  auto end() const { return refs_.end(); }

  // "[mysdk@11, othersdk@3]"
  std::string to_string() const;

  bool operator==(sdk_refs const &) const = default;

 private:
  std::vector<sdk_ref> refs_;
};

}  // namespace sdkgraph
