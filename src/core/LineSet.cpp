/* @file LineSet.cpp
 * @brief Literal line membership + append-only merge.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <unordered_set>

// fieldkit headers
#include "core/LineSet.hpp"

using namespace fieldkit::core;

namespace {

  std::string_view trimRight(std::string_view s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
      s.remove_suffix(1);
    return s;
  }

} // namespace

LineSet LineSet::parse(std::string_view content) {
  LineSet set;
  if (content.empty())
    return set;

  set.trailingNewline_ = content.back() == '\n';
  if (set.trailingNewline_)
    content.remove_suffix(1);

  std::size_t start = 0;
  while (true) {
    const auto nl = content.find('\n', start);
    if (nl == std::string_view::npos) {
      set.lines_.emplace_back(content.substr(start));
      break;
    }
    set.lines_.emplace_back(content.substr(start, nl - start));
    start = nl + 1;
  }
  return set;
}

bool LineSet::contains(std::string_view line) const {
  const auto wanted = trimRight(line);
  return std::any_of(lines_.begin(), lines_.end(),
                     [&](const std::string& l) { return trimRight(l) == wanted; });
}

std::vector<std::string> LineSet::missing(const std::vector<std::string>& entries) const {
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto& e : entries) {
    const std::string key{ trimRight(e) };
    if (key.empty() || !seen.insert(key).second)
      continue;
    if (!contains(key))
      out.push_back(key);
  }
  return out;
}

std::vector<std::string> LineSet::present(const std::vector<std::string>& entries) const {
  std::vector<std::string> out;
  for (const auto& e : entries) {
    if (contains(e))
      out.emplace_back(trimRight(e));
  }
  return out;
}

std::vector<std::string> LineSet::merge(const std::vector<std::string>& entries,
                                        const std::string& sectionComment) {
  auto added = missing(entries);
  if (added.empty())
    return added;

  if (!sectionComment.empty() && !contains(sectionComment)) {
    lines_.emplace_back("");
    lines_.push_back(sectionComment);
  }
  lines_.insert(lines_.end(), added.begin(), added.end());
  trailingNewline_ = true;
  return added;
}

std::string LineSet::render() const {
  std::string out;
  for (std::size_t i = 0; i < lines_.size(); ++i) {
    out += lines_[i];
    if (i + 1 < lines_.size() || trailingNewline_)
      out += '\n';
  }
  return out;
}
