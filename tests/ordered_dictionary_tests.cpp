// Unit tests for OrderedDictionary using GoogleTest.
// Order fidelity is checked against a std::list that receives the same operations.
#include <gtest/gtest.h>
#include <algorithm>
#include <iterator>
#include <list>
#include <string>
#include <utility>
#include <vector>

#include "ordered_dictionary.hpp"

// Applies every operation to both an OrderedDictionary and a reference std::list, validating after each step.
class Both {
public:
    std::list<int> list;
    OrderedDictionary<int, std::string> dict;

    Both& add(int item) {
        if (std::find(list.begin(), list.end(), item) == list.end()) list.push_back(item);
        dict.add(item, "v" + std::to_string(item));
        validate();
        return *this;
    }

    Both& remove(int item) {
        list.remove(item);
        dict.remove(item);
        validate();
        return *this;
    }

    Both& contains(int item) {
        bool in_list = std::find(list.begin(), list.end(), item) != list.end();
        EXPECT_EQ(in_list, dict.contains_key(item)) << "key " << item;
        return *this;
    }

    Both& move_first(int item) {
        if (take(item)) list.push_front(item);
        dict.move_first(item);
        validate();
        return *this;
    }

    Both& move_last(int item) {
        if (take(item)) list.push_back(item);
        dict.move_last(item);
        validate();
        return *this;
    }

    Both& move_before(int item, int mark) {
        if (item != mark && has(mark) && take(item)) list.insert(find(mark), item);
        dict.move_before(item, mark);
        validate();
        return *this;
    }

    Both& move_after(int item, int mark) {
        if (item != mark && has(mark) && take(item)) list.insert(std::next(find(mark)), item);
        dict.move_after(item, mark);
        validate();
        return *this;
    }

private:
    bool has(int item) const { return std::find(list.begin(), list.end(), item) != list.end(); }
    std::list<int>::iterator find(int item) { return std::find(list.begin(), list.end(), item); }

    bool take(int item) {
        auto it = find(item);
        if (it == list.end()) return false;
        list.erase(it);
        return true;
    }

    void validate() const {
        std::vector<int> expected(list.begin(), list.end());
        std::vector<int> expected_reversed(list.rbegin(), list.rend());

        std::vector<int> keys(dict.keys().begin(), dict.keys().end());
        EXPECT_EQ(keys, expected);

        std::vector<int> from_pairs;
        for (const auto& kv : dict) from_pairs.push_back(kv.first);
        EXPECT_EQ(from_pairs, expected);

        std::vector<int> reversed;
        for (const auto& kv : dict.reversed()) reversed.push_back(kv.first);
        EXPECT_EQ(reversed, expected_reversed);

        std::vector<int> copied_keys;
        dict.keys().copy_to(std::back_inserter(copied_keys));
        EXPECT_EQ(copied_keys, expected);

        std::vector<std::pair<int, std::string>> copied;
        dict.copy_to(std::back_inserter(copied));
        std::vector<int> copied_data;
        for (const auto& kv : copied) copied_data.push_back(kv.first);
        EXPECT_EQ(copied_data, expected);

        std::string diag;
        EXPECT_TRUE(dict.validate_invariants(&diag)) << diag;
    }
};

Both make_both(int n) {
    Both b;
    for (int i = 1; i <= n; ++i) b.add(i);
    return b;
}

TEST(OrderFidelity, Add) {
    Both().add(1).add(2).add(3);
}

TEST(OrderFidelity, AddRemove) {
    Both().add(1).add(2).add(3).remove(2).add(4).contains(2).contains(3);
    Both().add(1).add(2).add(3).remove(2).add(4).remove(4).remove(3).remove(1).remove(2);
    Both().add(1).add(2).add(3).remove(2).add(4).remove(4).remove(3).remove(1).remove(2).add(5);

    Both x;
    for (int i = 0; i < 100; ++i) x.add(i);
    for (int i = 0; i < 100; ++i) x.remove(i);
    EXPECT_TRUE(x.dict.empty());
}

TEST(OrderFidelity, MoveOnSmallDictionaries) {
    make_both(1).move_first(1);
    make_both(1).move_last(1);
    make_both(1).move_first(2);
    make_both(1).move_last(2);

    make_both(2).move_first(1);
    make_both(2).move_last(1);
    make_both(2).move_first(2);
    make_both(2).move_last(2);

    make_both(2).move_after(1, 2);
    make_both(2).move_after(2, 1);
    make_both(2).move_before(1, 2);
    make_both(2).move_before(2, 1);
}

TEST(OrderFidelity, MoveOnFourEntries) {
    make_both(4).move_first(1).move_first(2).move_first(3).move_first(4).move_first(6);
    make_both(4).move_first(4).move_first(3).move_first(2).move_first(1);
    make_both(4).move_last(1).move_last(2).move_last(3).move_last(4).move_last(6);
    make_both(4).move_last(4).move_last(3).move_last(2).move_last(1);

    make_both(4).move_before(1, 2).move_before(2, 1).move_before(4, 3).move_before(4, 3);
    make_both(4).move_after(1, 2).move_after(2, 1).move_after(4, 3).move_after(4, 3);
    make_both(4).move_after(1, 4);
    make_both(4).move_after(4, 1);
    make_both(4).move_before(4, 1);
    make_both(4).move_before(1, 4);
}

TEST(OrderFidelity, MoveRelativeToSelfOrMissingKey) {
    make_both(4).move_after(1, 1);
    make_both(4).move_after(4, 4);
    make_both(4).move_before(1, 1);
    make_both(4).move_before(4, 4);

    make_both(4).move_after(1, 6);
    make_both(4).move_after(6, 1);
    make_both(4).move_before(1, 6);
    make_both(4).move_before(6, 1);
}

TEST(OrderFidelity, MoveReturnsKeyPresence) {
    OrderedDictionary<int, int> d{{1, 10}, {2, 20}};
    EXPECT_TRUE(d.move_first(2));
    EXPECT_FALSE(d.move_first(6));
    EXPECT_TRUE(d.move_after(1, 6));
    EXPECT_FALSE(d.move_before(6, 1));
    EXPECT_TRUE(d.move_before(1, 1));
}

TEST(DictionaryApi, IndexerAppendsDefault) {
    OrderedDictionary<std::string, int> d;
    d["b"] = 2;
    d["a"] += 1;
    d["b"] += 10;
    EXPECT_EQ(d.size(), 2u);
    EXPECT_EQ(d.at("a"), 1);
    EXPECT_EQ(d.at("b"), 12);
    std::vector<std::string> keys(d.keys().begin(), d.keys().end());
    EXPECT_EQ(keys, (std::vector<std::string>{"b", "a"}));
}

TEST(DictionaryApi, AtThrowsForMissingKey) {
    OrderedDictionary<std::string, int> d;
    d.add("x", 1);
    EXPECT_THROW(d.at("y"), std::out_of_range);
    const auto& cd = d;
    EXPECT_THROW(cd.at("y"), std::out_of_range);
    EXPECT_EQ(cd.at("x"), 1);
}

TEST(DictionaryApi, AddDuplicateThrows) {
    OrderedDictionary<std::string, int> d;
    d.add("x", 1);
    EXPECT_THROW(d.add("x", 2), duplicate_key_error);
    EXPECT_EQ(d.at("x"), 1);
    EXPECT_FALSE(d.try_add("x", 3));
    EXPECT_TRUE(d.try_add("y", 4));
    EXPECT_EQ(d.at("x"), 1);
}

TEST(DictionaryApi, InsertOrAssignOverwritesInPlace) {
    OrderedDictionary<std::string, int> d;
    EXPECT_TRUE(d.insert_or_assign("a", 1));
    EXPECT_TRUE(d.insert_or_assign("b", 2));
    EXPECT_FALSE(d.insert_or_assign("a", 100));
    EXPECT_EQ(d.at("a"), 100);
    EXPECT_EQ(d.begin()->first, "a");
}

TEST(DictionaryApi, TryGetAndDefault) {
    OrderedDictionary<int, std::string> d;
    d.add(1, "one");
    std::string out;
    EXPECT_TRUE(d.try_get_value(1, out));
    EXPECT_EQ(out, "one");
    EXPECT_FALSE(d.try_get_value(2, out));
    EXPECT_EQ(out, "one");
    EXPECT_EQ(d.get_value_or_default(1), "one");
    EXPECT_EQ(d.get_value_or_default(2), "");
}

TEST(DictionaryApi, RemoveWithValue) {
    OrderedDictionary<int, std::string> d;
    d.add(1, "one");
    d.add(2, "two");
    std::string out;
    EXPECT_TRUE(d.remove(1, out));
    EXPECT_EQ(out, "one");
    EXPECT_FALSE(d.remove(1, out));
    EXPECT_EQ(d.count(1), 0u);
    EXPECT_EQ(d.count(2), 1u);
}

TEST(DictionaryApi, ValuesViewFollowsKeyOrder) {
    OrderedDictionary<int, std::string> d{{3, "c"}, {1, "a"}, {2, "b"}};
    d.move_last(3);
    std::vector<std::string> values(d.values().begin(), d.values().end());
    EXPECT_EQ(values, (std::vector<std::string>{"a", "b", "c"}));
    std::vector<std::string> rvalues(d.values().rbegin(), d.values().rend());
    EXPECT_EQ(rvalues, (std::vector<std::string>{"c", "b", "a"}));
    EXPECT_TRUE(d.values().contains("b"));
    EXPECT_FALSE(d.values().contains("z"));
    EXPECT_TRUE(d.contains_value("c"));

    std::vector<int> rkeys;
    for (int k : d.keys().reversed()) rkeys.push_back(k);
    EXPECT_EQ(rkeys, (std::vector<int>{3, 2, 1}));
}

TEST(DictionaryApi, RangeConstructionRejectsRepeatedKeys) {
    std::vector<std::pair<int, int>> src{{1, 1}, {2, 2}, {1, 3}};
    EXPECT_THROW((OrderedDictionary<int, int>(src.begin(), src.end())), duplicate_key_error);

    std::vector<std::pair<int, int>> ok{{5, 50}, {4, 40}};
    OrderedDictionary<int, int> d(ok.begin(), ok.end());
    EXPECT_EQ(d.begin()->first, 5);
    EXPECT_EQ(d.size(), 2u);
}

TEST(DictionaryApi, StartingKeyEnumeration) {
    OrderedDictionary<int, int> d;
    for (int i = 1; i <= 5; ++i) d.add(i, i * i);

    std::vector<int> tail;
    for (auto it = d.begin(4); it != d.end(); ++it) tail.push_back(it->second);
    EXPECT_EQ(tail, (std::vector<int>{16, 25}));

    std::vector<int> head;
    for (auto it = d.rbegin(2); it != d.rend(); ++it) head.push_back(it->first);
    EXPECT_EQ(head, (std::vector<int>{2, 1}));

    EXPECT_TRUE(d.begin(9) == d.end());
    EXPECT_TRUE(d.rbegin(9) == d.rend());
}

TEST(DictionaryApi, ReversedViewLookups) {
    OrderedDictionary<int, int> d{{1, 10}, {2, 20}};
    auto r = d.reversed();
    EXPECT_EQ(r.size(), 2u);
    EXPECT_TRUE(r.contains_key(2));
    EXPECT_EQ(r.at(1), 10);
    EXPECT_EQ(r.begin()->first, 2);
}

TEST(VersionStamps, StructuralChangesInvalidate) {
    OrderedDictionary<int, int> d{{1, 10}, {2, 20}};

    auto it = d.begin();
    d.add(3, 30);
    EXPECT_THROW(*it, stale_handle_error);

    auto kit = d.keys().begin();
    d.insert_or_assign(1, 11);
    EXPECT_THROW(*kit, stale_handle_error);

    auto vit = d.values().begin();
    d.move_last(1);
    EXPECT_THROW(++vit, stale_handle_error);
}

TEST(VersionStamps, ValueWritesKeepIteratorsValid) {
    OrderedDictionary<int, int> d{{1, 10}, {2, 20}};
    auto it = d.begin();
    d[1] = 100;
    d.at(2) = 200;
    it.value() += 1;
    EXPECT_EQ(it->second, 101);
    ++it;
    EXPECT_EQ(it->second, 200);
}

TEST(Lifecycle, ClearReplayAndTrim) {
    OrderedDictionary<int, int> d;
    std::vector<int> sequence{9, 4, 7, 1, 8};
    for (int k : sequence) d.add(k, k);
    std::vector<int> before(d.keys().begin(), d.keys().end());
    const auto cap = d.capacity();

    d.clear();
    EXPECT_TRUE(d.empty());
    EXPECT_EQ(d.capacity(), cap);
    for (int k : sequence) d.add(k, k);
    std::vector<int> after(d.keys().begin(), d.keys().end());
    EXPECT_EQ(after, before);

    d.remove(4);
    d.remove(1);
    d.trim_excess();
    EXPECT_EQ(d.capacity(), 3u);
    std::vector<int> trimmed(d.keys().begin(), d.keys().end());
    EXPECT_EQ(trimmed, (std::vector<int>{9, 7, 8}));
}

TEST(Lifecycle, SwapAndMove) {
    OrderedDictionary<int, int> a{{1, 1}};
    OrderedDictionary<int, int> b{{2, 2}, {3, 3}};
    swap(a, b);
    EXPECT_EQ(a.size(), 2u);
    EXPECT_EQ(b.begin()->first, 1);

    OrderedDictionary<int, int> c(std::move(a));
    EXPECT_TRUE(a.empty());
    EXPECT_EQ(c.size(), 2u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
