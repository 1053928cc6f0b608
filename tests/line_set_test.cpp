// fieldkit headers
#include "core/LineSet.hpp"

// GTest headers
#include <gtest/gtest.h>

using fieldkit::core::LineSet;

TEST(line_set, render_reproduces_parsed_bytes) {
  for (const std::string text : { "", "a", "a\n", "a\n\nb\n", "x\r\ny", "\n\n" }) {
    EXPECT_EQ(LineSet::parse(text).render(), text) << "input: '" << text << "'";
  }
}

TEST(line_set, lines_of_a_temporary_outlive_it) {
  std::vector<std::string> seen;
  for (const auto& line : LineSet::parse("first\n\nlast\n").lines())
    seen.push_back(line);
  EXPECT_EQ(seen, (std::vector<std::string>{ "first", "", "last" }));
}

TEST(line_set, membership_ignores_trailing_whitespace_only) {
  const auto set = LineSet::parse("root ALL=(ALL) ALL  \r\n#includedir /etc/sudoers.d\n");
  EXPECT_TRUE(set.contains("root ALL=(ALL) ALL"));
  EXPECT_TRUE(set.contains("#includedir /etc/sudoers.d"));
  EXPECT_FALSE(set.contains(" root ALL=(ALL) ALL"));
  EXPECT_FALSE(set.contains("root ALL"));
}

TEST(line_set, missing_is_deduplicated_in_order) {
  const auto set = LineSet::parse("b\n");
  const auto missing = set.missing({ "c", "a", "b", "c", "", "a" });
  EXPECT_EQ(missing, (std::vector<std::string>{ "c", "a" }));
}

TEST(line_set, merge_appends_comment_once_then_is_a_no_op) {
  auto set = LineSet::parse("Defaults env_reset\n");
  const auto added = set.merge({ "u ALL=(ALL) NOPASSWD: /usr/bin/gpio" }, "# grants");
  EXPECT_EQ(added.size(), 1u);
  EXPECT_EQ(set.render(), "Defaults env_reset\n\n# grants\nu ALL=(ALL) NOPASSWD: /usr/bin/gpio\n");

  const auto before = set.render();
  EXPECT_TRUE(set.merge({ "u ALL=(ALL) NOPASSWD: /usr/bin/gpio" }, "# grants").empty());
  EXPECT_EQ(set.render(), before);
}

TEST(line_set, merge_never_rewrites_existing_lines) {
  auto set = LineSet::parse("keep me\n# grants\nold entry");
  set.merge({ "new entry" }, "# grants");
  EXPECT_EQ(set.render(), "keep me\n# grants\nold entry\nnew entry\n");
}

TEST(line_set, present_keeps_request_order) {
  const auto set = LineSet::parse("two\none\n");
  EXPECT_EQ(set.present({ "one", "three", "two" }), (std::vector<std::string>{ "one", "two" }));
}
