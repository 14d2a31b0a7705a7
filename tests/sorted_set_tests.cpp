// Unit tests for SortedSet using GoogleTest.
// Ordering is checked against a std::set that receives the same operations.
#include <gtest/gtest.h>
#include <functional>
#include <iterator>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "sorted_set.hpp"

// Applies each operation to a SortedSet and a std::set and compares forward, reversed and copied contents.
class Both {
public:
    std::set<int> reference;
    SortedSet<int> set;

    Both& add(int item) {
        EXPECT_EQ(set.add(item), reference.insert(item).second) << "add " << item;
        validate();
        return *this;
    }

    Both& remove(int item) {
        EXPECT_EQ(set.remove(item), reference.erase(item) == 1) << "remove " << item;
        validate();
        return *this;
    }

    Both& contains(int item) {
        EXPECT_EQ(set.contains(item), reference.count(item) == 1) << "contains " << item;
        return *this;
    }

private:
    void validate() const {
        std::vector<int> expected(reference.begin(), reference.end());
        std::vector<int> expected_reversed(reference.rbegin(), reference.rend());

        std::vector<int> forward(set.begin(), set.end());
        EXPECT_EQ(forward, expected);

        std::vector<int> reversed;
        for (int v : set.reversed()) reversed.push_back(v);
        EXPECT_EQ(reversed, expected_reversed);

        std::vector<int> copied;
        set.copy_to(std::back_inserter(copied));
        EXPECT_EQ(copied, expected);

        EXPECT_EQ(set.size(), reference.size());
        std::string diag;
        EXPECT_TRUE(set.validate_invariants(&diag)) << diag;
    }
};

TEST(SortedOrder, Add) {
    Both().add(3).add(1).add(2).add(2);
}

TEST(SortedOrder, AddRemove) {
    Both().add(1).add(2).add(3).remove(2).add(4).contains(2).contains(3);
    Both().add(1).add(2).add(3).remove(2).add(4).remove(4).remove(3).remove(1).remove(2);
    Both().add(1).add(2).add(3).remove(2).add(4).remove(4).remove(3).remove(1).remove(2).add(5);

    Both x;
    for (int i = 0; i < 100; ++i) x.add((i * 37) % 100);
    for (int i = 0; i < 100; ++i) x.remove(i);
    EXPECT_TRUE(x.set.empty());
}

TEST(SortedSetApi, MinMaxAndEmptyThrows) {
    SortedSet<int> s;
    EXPECT_THROW(s.min(), std::out_of_range);
    EXPECT_THROW(s.max(), std::out_of_range);
    s.add(5);
    s.add(-2);
    s.add(11);
    EXPECT_EQ(s.min(), -2);
    EXPECT_EQ(s.max(), 11);
    EXPECT_EQ(s.first_node().value(), -2);
    EXPECT_EQ(s.last_node().value(), 11);
}

TEST(SortedSetApi, NeighbourQueries) {
    SortedSet<int> s{10, 20, 30};
    EXPECT_EQ(s.find_next(10).value(), 20);
    EXPECT_EQ(s.find_next(15).value(), 20);
    EXPECT_TRUE(s.find_next(30).is_null());
    EXPECT_EQ(s.find_previous(30).value(), 20);
    EXPECT_EQ(s.find_previous(25).value(), 20);
    EXPECT_TRUE(s.find_previous(10).is_null());
    EXPECT_TRUE(s.find(15).is_null());
    EXPECT_EQ(s.find(20).next().value(), 30);
    EXPECT_EQ(s.find(20).previous().value(), 10);

    EXPECT_EQ(*s.lower_bound(20), 20);
    EXPECT_EQ(*s.upper_bound(20), 30);
    EXPECT_TRUE(s.upper_bound(30) == s.end());
}

TEST(SortedSetApi, CustomComparatorReversesOrder) {
    SortedSet<std::string, std::greater<std::string>> s{"b", "c", "a"};
    std::vector<std::string> items(s.begin(), s.end());
    EXPECT_EQ(items, (std::vector<std::string>{"c", "b", "a"}));
    EXPECT_EQ(s.min(), "c");
    EXPECT_EQ(s.max(), "a");
}

TEST(SortedSetApi, CopyToWithLimit) {
    SortedSet<int> s{4, 2, 8, 6};
    std::vector<int> out;
    s.copy_to(std::back_inserter(out), 2);
    EXPECT_EQ(out, (std::vector<int>{2, 4}));
    out.clear();
    s.copy_to(std::back_inserter(out), 10);
    EXPECT_EQ(out, (std::vector<int>{2, 4, 6, 8}));
}

TEST(SortedSetApi, RangeConstructionDropsRepeats) {
    std::vector<int> src{9, 3, 9, 1, 3, 7};
    SortedSet<int> s(src.begin(), src.end());
    EXPECT_EQ(std::vector<int>(s.begin(), s.end()), (std::vector<int>{1, 3, 7, 9}));
    EXPECT_EQ(s.capacity(), 4u);
    EXPECT_TRUE(s.validate_invariants());
}

TEST(SortedSetEquality, SetEqualsAndHash) {
    SortedSet<int> a{1, 2, 3};
    SortedSet<int> b{3, 2, 1};
    SortedSet<int> c{1, 2, 4};
    SortedSet<int> d{1, 2};

    EXPECT_TRUE(a.set_equals(b));
    EXPECT_TRUE(a == b);
    EXPECT_TRUE(a != c);
    EXPECT_FALSE(a.set_equals(d));

    SortedSetHash<int> h;
    EXPECT_EQ(h(a), h(b));
    EXPECT_EQ(h(SortedSet<int>()), 0u);
}

TEST(SortedSetLifecycle, TrimClearSwap) {
    SortedSet<int> s;
    for (int i = 0; i < 100; ++i) s.add(i);
    for (int i = 0; i < 100; i += 2) s.remove(i);
    s.trim_excess();
    EXPECT_EQ(s.capacity(), 50u);
    EXPECT_EQ(s.min(), 1);
    EXPECT_EQ(s.max(), 99);
    EXPECT_TRUE(s.validate_invariants());

    SortedSet<int> other{-1};
    swap(s, other);
    EXPECT_EQ(s.size(), 1u);
    EXPECT_EQ(other.size(), 50u);

    other.clear();
    EXPECT_TRUE(other.empty());
    EXPECT_EQ(other.capacity(), 50u);
}

TEST(SortedSetLifecycle, StaleIteratorAndNode) {
    SortedSet<int> s{1, 2, 3};
    auto it = s.begin();
    auto node = s.find(2);
    s.add(4);
    EXPECT_THROW(*it, stale_handle_error);
    EXPECT_THROW(node.value(), stale_handle_error);

    auto fresh = s.begin();
    s.add(4);
    s.remove(9);
    EXPECT_THROW(*fresh, stale_handle_error);
}

TEST(SortedSetDiagnostics, TreeDump) {
    SortedSet<int> empty;
    std::ostringstream e;
    empty.tree_dump(e);
    EXPECT_EQ(e.str(), "<empty tree>\n");

    SortedSet<int> s{1, 2, 3};
    std::ostringstream oss;
    s.tree_dump(oss);
    EXPECT_NE(oss.str().find("B 2"), std::string::npos);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
