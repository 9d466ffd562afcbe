#include "build_file.h"

#include "module_graph.h"
#include "sol_util.h"
#include "tui.h"

#include <cctype>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace sdkgraph {

namespace {

constexpr std::string_view kDirectivePrefix{ "@sdkgraph" };

size_t skip_whitespace(std::string_view s, size_t pos) {
  while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t')) { ++pos; }
  return pos;
}

std::string_view parse_identifier(std::string_view s, size_t &pos) {
  size_t const start{ pos };
  while ((pos < s.size()) && (std::isalnum(static_cast<unsigned char>(s[pos])) ||
                              s[pos] == '_' || s[pos] == '-')) {
    ++pos;
  }
  return s.substr(start, pos - start);
}

// Expects pos at the opening quote, advances past the closing quote
std::optional<std::string> parse_quoted_value(std::string_view s, size_t &pos) {
  if (pos >= s.size() || s[pos] != '"') { return std::nullopt; }
  ++pos;

  std::string result;
  while (pos < s.size() && s[pos] != '"') {
    if (s[pos] == '\\' && pos + 1 < s.size() && (s[pos + 1] == '"' || s[pos + 1] == '\\')) {
      result += s[pos + 1];
      pos += 2;
      continue;
    }
    result += s[pos++];
  }

  if (pos >= s.size()) { return std::nullopt; }
  ++pos;
  return result;
}

// -- @sdkgraph <key> "<value>"
std::optional<std::pair<std::string, std::string>> parse_directive_line(
    std::string_view line) {
  size_t pos{ skip_whitespace(line, 0) };

  if (pos + 2 > line.size() || line[pos] != '-' || line[pos + 1] != '-') {
    return std::nullopt;
  }
  pos = skip_whitespace(line, pos + 2);

  if (line.substr(pos, kDirectivePrefix.size()) != kDirectivePrefix) { return std::nullopt; }
  pos += kDirectivePrefix.size();

  if (pos >= line.size() || (line[pos] != ' ' && line[pos] != '\t')) {
    return std::nullopt;
  }
  pos = skip_whitespace(line, pos);

  auto const key{ parse_identifier(line, pos) };
  if (key.empty()) { return std::nullopt; }

  pos = skip_whitespace(line, pos);

  auto const value{ parse_quoted_value(line, pos) };
  if (!value) { return std::nullopt; }

  return std::make_pair(std::string{ key }, *value);
}

struct declaration {
  std::string type;
  sol::table props;
};

}  // namespace

build_file_meta parse_build_file_meta(std::string_view content) {
  build_file_meta result;
  size_t line_start{ 0 };

  while (line_start < content.size()) {
    size_t const line_end{ content.find('\n', line_start) };
    auto const line{ content.substr(
        line_start,
        (line_end == std::string_view::npos ? content.size() : line_end) - line_start) };

    if (auto const directive{ parse_directive_line(line) }) {
      auto const &[key, value]{ *directive };
      if (key == "out-dir") {
        result.out_dir = value;
      } else {
        tui::warn("Ignoring unknown build file directive: %s", key.c_str());
      }
    }

    if (line_end == std::string_view::npos) { break; }
    line_start = line_end + 1;
  }

  return result;
}

std::optional<std::filesystem::path> build_file::discover() {
  namespace fs = std::filesystem;

  auto cur{ fs::current_path() };

  for (;;) {
    auto const candidate{ cur / kBuildFileName };
    if (fs::exists(candidate)) { return candidate; }

    auto const git_path{ cur / ".git" };
    if (fs::exists(git_path) && fs::is_directory(git_path)) { return std::nullopt; }

    auto const parent{ cur.parent_path() };
    if (parent == cur) { return std::nullopt; }

    cur = parent;
  }
}

std::filesystem::path build_file::find_path(
    std::optional<std::filesystem::path> const &explicit_path) {
  if (explicit_path) {
    auto const path{ std::filesystem::absolute(*explicit_path) };
    if (!std::filesystem::exists(path)) {
      throw std::runtime_error("build file not found: " + path.string());
    }
    return path;
  }

  if (auto const discovered{ discover() }) { return *discovered; }
  throw std::runtime_error("build file not found (no " + std::string{ kBuildFileName } +
                           " between the current directory and the repository root)");
}

std::unique_ptr<build_file> build_file::load(std::filesystem::path const &path,
                                             module_type_registry const &types) {
  tui::debug("Loading build file: %s", path.string().c_str());
  return load(util_load_file(path), path, types);
}

std::unique_ptr<build_file> build_file::load(std::vector<unsigned char> const &content,
                                             std::filesystem::path const &path,
                                             module_type_registry const &types) {
  std::string const script{ reinterpret_cast<char const *>(content.data()), content.size() };

  auto result{ std::make_unique<build_file>() };
  result->path = path;
  result->meta = parse_build_file_meta(script);

  auto state{ sol_util_make_lua_state() };
  std::vector<declaration> declarations;

  for (auto const &type : types.type_names()) {
    (*state)[type] = [&declarations, type](sol::object props) {
      if (props.get_type() != sol::type::table) {
        throw std::runtime_error(type + " expects a table of properties");
      }
      declarations.push_back(declaration{ .type = type, .props = props.as<sol::table>() });
    };
  }

  if (sol::protected_function_result const run{
          state->safe_script(script, sol::script_pass_on_error, path.string()) };
      !run.valid()) {
    sol::error err = run;
    throw std::runtime_error("Failed to execute build file " + path.string() + ": " +
                             err.what());
  }

  sol::table const globals = (*state)["_G"];
  result->default_variants =
      sol_util_get_string_list(globals, "DEFAULT_VARIANTS", path.string());

  for (auto const &decl : declarations) {
    auto variants{ sol_util_get_string_list(decl.props, "variants", decl.type) };
    if (variants.empty()) { variants = result->default_variants; }
    if (variants.empty()) { variants.emplace_back(); }

    auto const &factory{ *types.find(decl.type) };
    for (auto &variant : variants) {
      try {
        result->modules.push_back(factory(decl.props, std::move(variant)));
      } catch (std::runtime_error const &e) {
        throw std::runtime_error(path.string() + ": " + e.what());
      }
    }
  }

  tui::debug("Loaded %zu declarations (%zu modules) from %s",
             declarations.size(),
             result->modules.size(),
             path.string().c_str());
  return result;
}

std::unique_ptr<build_file> build_file::load(char const *script,
                                             std::filesystem::path const &path,
                                             module_type_registry const &types) {
  return load(std::vector<unsigned char>(script, script + std::strlen(script)), path, types);
}

void build_file::populate(module_graph &graph) {
  for (auto &m : modules) { graph.add(std::move(m)); }
  modules.clear();
}

}  // namespace sdkgraph
