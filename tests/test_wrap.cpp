#include "wrap.hpp"
#include "text_buffer.hpp"
#include <cassert>
#include <string>
#include <utility>
#include <vector>

static void test_row_counts() {
  for (int w = 1; w <= 20; ++w) {
    for (size_t len = 0; len <= 300; ++len) {
      size_t expect = len == 0 ? 1 : (len + w - 1) / w;
      assert(rows_for_len(len, w) == expect);
      size_t last = last_row_start(len, w);
      assert(last % w == 0);
      assert(last == 0 || last < len);
      assert(len - last <= static_cast<size_t>(w));
    }
  }
  assert(rows_for_len(0, 80) == 1);
  assert(rows_for_len(80, 80) == 1);
  assert(rows_for_len(81, 80) == 2);
  assert(rows_for_len(160, 80) == 2);
  assert(last_row_start(160, 80) == 80);
  assert(last_row_start(100, 80) == 80);
  assert(last_row_start(80, 80) == 0);
}

static void test_end_of_row() {
  assert(end_of_row(0, 0, 80) == 0);
  assert(end_of_row(5, 0, 80) == 4);
  assert(end_of_row(100, 0, 80) == 79);
  assert(end_of_row(100, 80, 80) == 19);
  assert(end_of_row(160, 80, 80) == 79);
  assert(row_start(99, 80) == 80);
  assert(row_start(79, 80) == 0);
}

static void test_row_walk() {
  TextBuffer b({"hello", "", std::string(100, 'a')});
  RowRef r{0, 0};
  std::vector<std::pair<size_t, size_t>> seen{{r.line, r.start}};
  while (next_row(b, 80, r)) seen.emplace_back(r.line, r.start);
  assert(seen.size() == 4);
  assert(seen[1] == std::make_pair(size_t(1), size_t(0)));
  assert(seen[2] == std::make_pair(size_t(2), size_t(0)));
  assert(seen[3] == std::make_pair(size_t(2), size_t(80)));
  for (size_t i = seen.size() - 1; i > 0; --i) {
    assert(prev_row(b, 80, r));
    assert(r.line == seen[i - 1].first && r.start == seen[i - 1].second);
  }
  assert(!prev_row(b, 80, r));
}

static void test_locate() {
  TextBuffer b({"hello", "", std::string(100, 'a')});
  Viewport vp{80, 24, 0, 0};
  auto p = locate(b, vp, 2, 80);
  assert(p && p->row == 3 && p->col == 0);
  p = locate(b, vp, 2, 99);
  assert(p && p->row == 3 && p->col == 19);
  p = locate(b, vp, 0, 4);
  assert(p && p->row == 0 && p->col == 4);
  Viewport scrolled{80, 2, 2, 80};
  assert(!locate(b, scrolled, 2, 10));
  assert(!locate(b, scrolled, 0, 0));
  p = locate(b, scrolled, 2, 85);
  assert(p && p->row == 0 && p->col == 5);
  Viewport tiny{80, 2, 0, 0};
  assert(!locate(b, tiny, 2, 0));
}

int main() {
  test_row_counts();
  test_end_of_row();
  test_row_walk();
  test_locate();
  return 0;
}
