#include "sol_util.h"

#include <algorithm>
#include <map>

namespace sdkgraph {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base, sol::lib::string, sol::lib::table, sol::lib::math);
  return lua;
}

std::vector<std::string> sol_util_get_string_list(sol::table const &table,
                                                  std::string_view key,
                                                  std::string_view context) {
  auto const list{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!list) { return {}; }

  std::string const where{ std::string(context) + ": " + std::string(key) };

  std::map<std::size_t, std::string> ordered;
  for (auto const &[k, v] : *list) {
    if (k.get_type() != sol::type::number) {
      throw std::runtime_error(where + " must be a list, not a map");
    }
    if (v.get_type() != sol::type::string) {
      throw std::runtime_error(where + " must contain only strings");
    }
    ordered.emplace(k.as<std::size_t>(), v.as<std::string>());
  }

  std::vector<std::string> result;
  result.reserve(ordered.size());
  std::size_t expected{ 1 };
  for (auto &[index, value] : ordered) {
    if (index != expected++) { throw std::runtime_error(where + " must not have holes"); }
    result.push_back(std::move(value));
  }
  return result;
}

void sol_util_check_keys(sol::table const &table,
                         std::initializer_list<std::string_view> allowed,
                         std::string_view context) {
  for (auto const &[k, v] : table) {
    if (k.get_type() != sol::type::string) {
      throw std::runtime_error(std::string(context) + ": properties must be named");
    }
    auto const name{ k.as<std::string>() };
    if (std::ranges::find(allowed, std::string_view{ name }) == allowed.end()) {
      throw std::runtime_error(std::string(context) + ": unknown property \"" + name + "\"");
    }
  }
}

}  // namespace sdkgraph
