#include "acmeflow/transport.hpp"

#include <algorithm>
#include <cctype>

namespace acmeflow {

bool HeaderMap::CaseInsensitiveLess::operator()(
    std::string_view lhs, std::string_view rhs) const noexcept {
  return std::lexicographical_compare(
      lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) <
               std::tolower(static_cast<unsigned char>(b));
      });
}

HeaderMap::HeaderMap(
    std::initializer_list<std::pair<const std::string, std::string>> init)
    : headers_(init) {}

void HeaderMap::add(std::string name, std::string value) {
  headers_.emplace(std::move(name), std::move(value));
}

bool HeaderMap::has(std::string_view name) const {
  return headers_.find(name) != headers_.end();
}

std::vector<std::string> HeaderMap::get(std::string_view name) const {
  std::vector<std::string> values;
  auto [begin, end] = headers_.equal_range(name);
  for (auto it = begin; it != end; ++it) {
    values.push_back(it->second);
  }
  return values;
}

std::optional<std::string> HeaderMap::first(std::string_view name) const {
  // multimap::find may return any of the equal keys
  auto [begin, end] = headers_.equal_range(name);
  if (begin == end) {
    return std::nullopt;
  }
  return begin->second;
}

}  // namespace acmeflow
