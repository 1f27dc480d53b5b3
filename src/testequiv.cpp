#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <equiv/parray.hpp>
#include <equiv/store.hpp>

using std::string;
using std::vector;
using namespace selfcore;
using equiv::PersistentArray;
using equiv::EquivalenceStore;

TEST(PersistentArray, PushAcrossLevels) {
  auto a = PersistentArray<int>();
  for (auto i = 0; i < 5000; i++) a = a.push(i * 3);
  ASSERT_EQ(a.size(), 5000u);
  for (auto i = 0uz; i < a.size(); i++) EXPECT_EQ(a.at(i), static_cast<int>(i) * 3);
}

TEST(PersistentArray, SetKeepsOldVersion) {
  auto a = PersistentArray<string, 2>();
  for (auto i = 0; i < 40; i++) a = a.push(std::to_string(i));
  auto const b = a.set(17, "x");
  EXPECT_EQ(a.at(17), "17");
  EXPECT_EQ(b.at(17), "x");
  EXPECT_EQ(b.at(16), "16");
  EXPECT_EQ(b.size(), a.size());
  auto const c = a.push("40");
  EXPECT_EQ(a.size(), 40u);
  EXPECT_EQ(c.at(40), "40");
}

TEST(PersistentArray, OutOfRange) {
  auto const a = PersistentArray<int>().push(1);
  EXPECT_THROW((void)a.at(1), std::out_of_range);
  EXPECT_THROW((void)a.set(5, 0), std::out_of_range);
  EXPECT_THROW((void)PersistentArray<int>().at(0), std::out_of_range);
}

TEST(EquivalenceStore, FreshHandlesAreSequential) {
  auto s = EquivalenceStore<int>();
  for (auto i = 0uz; i < 10; i++) {
    auto const [next, h] = s.fresh(static_cast<int>(i) * 10);
    EXPECT_EQ(h, i);
    s = next;
  }
  for (auto i = 0uz; i < 10; i++) {
    EXPECT_EQ(s.find(i).id, i);
    EXPECT_EQ(s.find(i).rank, 0u);
    EXPECT_EQ(s.descriptor(i), static_cast<int>(i) * 10);
  }
}

TEST(EquivalenceStore, UniteTwoSingletons) {
  auto const [s1, x] = EquivalenceStore<int>().fresh(10);
  auto const [s2, y] = s1.fresh(20);
  auto const s3 = s2.unite(x, y);
  EXPECT_TRUE(s3.equivalent(x, y));
  EXPECT_EQ(s3.descriptor(x), 20);
  EXPECT_EQ(s3.descriptor(y), 20);
  // Equal ranks: the first class goes under the second, whose rank grows
  EXPECT_EQ(s3.find(x).id, y);
  EXPECT_EQ(s3.find(y).rank, 1u);
  // Old versions are unaffected
  EXPECT_FALSE(s2.equivalent(x, y));
  EXPECT_EQ(s2.descriptor(x), 10);
}

TEST(EquivalenceStore, LowerRankGoesUnder) {
  auto s = EquivalenceStore<string>();
  auto handles = vector<size_t>();
  for (auto const d: {"a", "b", "c"}) {
    auto const [next, h] = s.fresh(d);
    handles.push_back(h);
    s = next;
  }
  s = s.unite(handles[0], handles[1]); // Root b, rank 1
  s = s.unite(handles[1], handles[2]); // c (rank 0) goes under b
  EXPECT_EQ(s.find(handles[2]).id, handles[1]);
  EXPECT_EQ(s.descriptor(handles[2]), "b");
  s = s.unite(handles[2], handles[0]);
  EXPECT_EQ(s.find(handles[0]).rank, 1u);
}

TEST(EquivalenceStore, UniteIsIdempotentAndTransitive) {
  auto s = EquivalenceStore<int>();
  for (auto i = 0; i < 6; i++) s = s.fresh(i).first;
  s = s.unite(0, 1).unite(2, 3).unite(1, 3);
  EXPECT_TRUE(s.equivalent(0, 2));
  EXPECT_TRUE(s.equivalent(3, 0));
  EXPECT_FALSE(s.equivalent(0, 4));
  auto const r = s.find(0);
  auto const t = s.unite(0, 2);
  EXPECT_EQ(t.find(0).id, r.id);
  EXPECT_EQ(t.find(0).rank, r.rank);
  EXPECT_EQ(t.find(4).id, 4u);
}

TEST(EquivalenceStore, InvalidHandle) {
  auto const s = EquivalenceStore<int>().fresh(1).first;
  EXPECT_THROW((void)s.find(1), std::out_of_range);
  EXPECT_THROW((void)s.unite(0, 7), std::out_of_range);
  EXPECT_THROW((void)s.descriptor(3), std::out_of_range);
}
