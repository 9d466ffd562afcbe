#include "sdk_ref.h"

#include "util.h"

#include <algorithm>
#include <charconv>
#include <stdexcept>

namespace sdkgraph {

std::optional<std::string> sdk_version_error(std::string_view version) {
  if (version == kSdkVersionCurrent) { return std::nullopt; }

  unsigned long long value{ 0 };
  auto const *first{ version.data() };
  auto const *last{ version.data() + version.size() };
  auto const [ptr, ec]{ std::from_chars(first, last, value) };
  if (version.empty() || ec != std::errc{} || ptr != last) {
    return "version " + util_quote(version) + " is neither a number nor \"current\"";
  }

  return std::nullopt;
}

sdk_ref sdk_ref::parse(std::string_view str) {
  auto const sep{ str.find(kSdkVersionSeparator) };
  if (sep == std::string_view::npos) {
    if (str.empty()) { throw std::runtime_error("sdk name must not be empty"); }
    return sdk_ref{ .name = std::string{ str }, .version = {} };
  }

  if (str.find(kSdkVersionSeparator, sep + 1) != std::string_view::npos) {
    throw std::runtime_error(util_quote(str) + " does not follow <name>@<version> syntax");
  }

  auto const name{ str.substr(0, sep) };
  auto const version{ str.substr(sep + 1) };
  if (name.empty()) {
    throw std::runtime_error(util_quote(str) + " has an empty sdk name");
  }
  if (version.empty()) {
    throw std::runtime_error(util_quote(str) + " has an empty version");
  }
  if (auto err{ sdk_version_error(version) }) { throw std::runtime_error(*err); }

  return sdk_ref{ .name = std::string{ name }, .version = std::string{ version } };
}

std::string sdk_ref::to_string() const {
  if (unversioned()) { return name; }
  return name + kSdkVersionSeparator + version;
}

sdk_refs::sdk_refs(std::initializer_list<sdk_ref> refs) {
  for (auto const &ref : refs) { add(ref); }
}

bool sdk_refs::contains(sdk_ref const &ref) const {
  return std::ranges::find(refs_, ref) != refs_.end();
}

bool sdk_refs::add(sdk_ref ref) {
  if (contains(ref)) { return false; }
  refs_.push_back(std::move(ref));
  return true;
}

bool sdk_refs::add_all(sdk_refs const &other) {
  bool grew{ false };
  for (auto const &ref : other) { grew = add(ref) || grew; }
  return grew;
}

std::string sdk_refs::to_string() const {
  std::vector<std::string> parts;
  parts.reserve(refs_.size());
  for (auto const &ref : refs_) { parts.push_back(ref.to_string()); }
  return "[" + util_join(parts, ", ") + "]";
}

}  // namespace sdkgraph
