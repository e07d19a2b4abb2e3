#include "minitest.hpp"
#include "parser/LineClassifier.hpp"

using glustat::parser::classify_line;
using glustat::parser::LineKind;

TEST(classify_brick_header_keeps_remainder_verbatim) {
  auto m = classify_line("Brick: server1.example.com:/data/glusterfs/vol0/brick1");
  ASSERT_TRUE(m.kind == LineKind::BrickHeader);
  ASSERT_EQ(m.value, "server1.example.com:/data/glusterfs/vol0/brick1");
}

TEST(classify_brick_header_with_colons_and_spaces) {
  auto m = classify_line("Brick: host:/exports/a:b c");
  ASSERT_TRUE(m.kind == LineKind::BrickHeader);
  ASSERT_EQ(m.value, "host:/exports/a:b c");
}

TEST(classify_brick_header_requires_prefix_at_line_start) {
  ASSERT_TRUE(classify_line("  Brick: host:/b").kind == LineKind::NoMatch);
  ASSERT_TRUE(classify_line("Brick:host:/b").kind == LineKind::NoMatch);
}

TEST(classify_data_read) {
  auto m = classify_line("   Data Read: 12345 bytes");
  ASSERT_TRUE(m.kind == LineKind::ReadBytes);
  ASSERT_EQ(m.value, "12345");
}

TEST(classify_data_written) {
  auto m = classify_line("Data Written: 67 bytes");
  ASSERT_TRUE(m.kind == LineKind::WriteBytes);
  ASSERT_EQ(m.value, "67");
}

TEST(classify_byte_counters_anchor_at_end_of_line) {
  ASSERT_TRUE(classify_line("Data Read: 12345 bytes total").kind == LineKind::NoMatch);
  ASSERT_TRUE(classify_line("Data Read: bytes").kind == LineKind::NoMatch);
  ASSERT_TRUE(classify_line("Data Read: 12a45 bytes").kind == LineKind::NoMatch);
  auto m = classify_line("Interval 3 Data Read: 9 bytes");
  ASSERT_TRUE(m.kind == LineKind::ReadBytes);
  ASSERT_EQ(m.value, "9");
}

TEST(classify_fop_candidate_returns_trimmed_line) {
  auto m = classify_line("      0.00       0.00 us       0.00 us       0.00 us              2     RELEASE  ");
  ASSERT_TRUE(m.kind == LineKind::FopCandidate);
  ASSERT_EQ(m.value, "0.00       0.00 us       0.00 us       0.00 us              2     RELEASE");
}

TEST(classify_fop_candidate_needs_decimal_prefix) {
  ASSERT_TRUE(classify_line("100 calls").kind == LineKind::NoMatch);
  ASSERT_TRUE(classify_line("12. foo").kind == LineKind::NoMatch);
  ASSERT_TRUE(classify_line(".5 foo").kind == LineKind::NoMatch);
  // weak filter: shape is not validated here
  ASSERT_TRUE(classify_line("1.5").kind == LineKind::FopCandidate);
}

TEST(classify_report_noise_is_no_match) {
  ASSERT_TRUE(classify_line("").kind == LineKind::NoMatch);
  ASSERT_TRUE(classify_line("Cumulative Stats:").kind == LineKind::NoMatch);
  ASSERT_TRUE(classify_line(" %-latency   Avg-latency   Min-Latency   Max-Latency   No. of calls         Fop").kind == LineKind::NoMatch);
  ASSERT_TRUE(classify_line(" ---------   -----------   -----------").kind == LineKind::NoMatch);
  ASSERT_TRUE(classify_line("    Duration: 3600 seconds").kind == LineKind::NoMatch);
}

TEST(classify_first_match_wins) {
  auto m = classify_line("Brick: Data Read: 5 bytes");
  ASSERT_TRUE(m.kind == LineKind::BrickHeader);
  ASSERT_EQ(m.value, "Data Read: 5 bytes");
  auto r = classify_line("1.5 Data Read: 5 bytes");
  ASSERT_TRUE(r.kind == LineKind::ReadBytes);
}
