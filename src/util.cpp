#include "util.h"

#include <cstdio>
#include <stdexcept>

namespace sdkgraph {

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.string().c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

std::string util_join(std::vector<std::string> const &parts, std::string_view separator) {
  std::string result;
  for (size_t i{ 0 }; i < parts.size(); ++i) {
    if (i) { result.append(separator); }
    result.append(parts[i]);
  }
  return result;
}

std::vector<std::string> util_split(std::string_view s, char delimiter) {
  std::vector<std::string> result;
  for (std::string_view sv{ s }; !sv.empty();) {
    auto const pos{ sv.find(delimiter) };
    auto const token{ sv.substr(0, pos) };
    if (!token.empty()) { result.emplace_back(token); }
    sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);
  }
  return result;
}

std::string util_quote(std::string_view s) {
  std::string result;
  result.reserve(s.size() + 2);
  result.push_back('"');
  for (char const ch : s) {
    if (ch == '"' || ch == '\\') { result.push_back('\\'); }
    result.push_back(ch);
  }
  result.push_back('"');
  return result;
}

}  // namespace sdkgraph
