#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sdkgraph {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as bytes.
// Throws std::runtime_error if file cannot be opened or read.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);

// Join strings with a separator: {"a", "b"} + ", " -> "a, b"
std::string util_join(std::vector<std::string> const &parts, std::string_view separator);

// Split on a single character, dropping empty tokens: "a,,b" -> {"a", "b"}
std::vector<std::string> util_split(std::string_view s, char delimiter);

// Quote a string the way diagnostics print names: abc -> "abc", a"b -> "a\"b"
std::string util_quote(std::string_view s);

}  // namespace sdkgraph
