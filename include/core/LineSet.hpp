#pragma once
/** @file  LineSet.hpp
 *  @brief Line-oriented view of a text file with an idempotent merge.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fieldkit {
  namespace core {

    /**
 * @class LineSet
 * @brief Membership and append-only merge over the literal lines of a file.
 *
 *  * `render()` of an unmerged set reproduces the parsed bytes exactly.
 *  * Membership ignores trailing whitespace and '\r' only; no pattern matching.
 *  * `merge()` never reorders or rewrites existing lines.
 */
    class LineSet {
    public:
      LineSet() = default;

      static LineSet parse(std::string_view content);

      bool contains(std::string_view line) const;

      /// Entries not yet present, de-duplicated, in first-occurrence order.
      std::vector<std::string> missing(const std::vector<std::string>& entries) const;

      /// Subset of \p entries that is present, in the order given.
      std::vector<std::string> present(const std::vector<std::string>& entries) const;

      /**
       * Append every missing entry. When something is appended and
       * \p sectionComment is non-empty and not yet in the set, a blank line and the
       * comment precede the entries.
       * @returns the entries actually appended (empty = no change).
       */
      std::vector<std::string> merge(const std::vector<std::string>& entries,
                                     const std::string& sectionComment = {});

      std::string render() const;

      const std::vector<std::string>& lines() const& noexcept { return lines_; }
      /// By value on a temporary so `for (auto& l : LineSet::parse(x).lines())` stays valid.
      std::vector<std::string> lines() && { return std::move(lines_); }
      bool empty() const noexcept { return lines_.empty(); }

    private:
      std::vector<std::string> lines_;
      bool trailingNewline_{ false };
    };

  } // namespace core
} // namespace fieldkit
