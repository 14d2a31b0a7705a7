// sorted_set.hpp
// Ordered set of unique elements backed by RBSlotTree.
//
// Usage:
//   SortedSet<int> s{5, 1, 3};
//   s.add(4);
//   auto n = s.find_next(3);          // node holding 4
//   for (int v : s.reversed()) ...    // 5 4 3 1

#ifndef SORTED_SET_HPP
#define SORTED_SET_HPP

#include <algorithm>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <string>
#include <utility>

#include "red_black_slot_tree.hpp"

template <
    typename T,
    typename Compare = std::less<T>
>
class SortedSet {
    using tree_type = RBSlotTree<T, Compare>;

public:
    using value_type             = T;
    using key_type               = T;
    using key_compare            = Compare;
    using size_type              = typename tree_type::size_type;
    using version_type           = typename tree_type::version_type;
    using node_type              = typename tree_type::node_type;
    using const_iterator         = typename tree_type::const_iterator;
    using iterator               = const_iterator;
    using const_reverse_iterator = typename tree_type::const_reverse_iterator;
    using reverse_iterator       = const_reverse_iterator;
    using reverse_view           = typename tree_type::reverse_view;

    explicit SortedSet(const key_compare& comp = key_compare()) : tree_(comp) {}
    explicit SortedSet(size_type capacity, const key_compare& comp = key_compare()) : tree_(capacity, comp) {}

    template <typename InputIt>
    SortedSet(InputIt first, InputIt last, const key_compare& comp = key_compare()) : tree_(first, last, comp) {}

    SortedSet(std::initializer_list<value_type> init, const key_compare& comp = key_compare()) : tree_(init, comp) {}

    bool empty() const noexcept { return tree_.empty(); }
    size_type size() const noexcept { return tree_.size(); }
    size_type capacity() const noexcept { return tree_.capacity(); }
    version_type version() const noexcept { return tree_.version(); }
    key_compare key_comp() const { return tree_.key_comp(); }

    const_iterator begin() const noexcept { return tree_.begin(); }
    const_iterator end() const noexcept { return tree_.end(); }
    const_reverse_iterator rbegin() const noexcept { return tree_.rbegin(); }
    const_reverse_iterator rend() const noexcept { return tree_.rend(); }
    reverse_view reversed() const noexcept { return tree_.reversed(); }

    // false when an equivalent element is already present
    bool add(const value_type& item) { return tree_.insert(item); }
    bool add(value_type&& item) { return tree_.insert(std::move(item)); }

    bool remove(const value_type& item) { return tree_.erase(item); }
    void clear() { tree_.clear(); }
    void trim_excess() { tree_.trim_excess(); }
    void swap(SortedSet& other) noexcept { tree_.swap(other.tree_); }

    bool contains(const value_type& item) const { return tree_.contains(item); }
    size_type count(const value_type& item) const { return tree_.count(item); }
    node_type find(const value_type& item) const { return tree_.find(item); }

    // Throws std::out_of_range on an empty set.
    const value_type& min() const { return tree_.min(); }
    const value_type& max() const { return tree_.max(); }

    node_type first_node() const { return tree_.first_node(); }
    node_type last_node() const { return tree_.last_node(); }
    node_type find_next(const value_type& item) const { return tree_.find_next(item); }
    node_type find_previous(const value_type& item) const { return tree_.find_previous(item); }

    const_iterator lower_bound(const value_type& item) const { return tree_.lower_bound(item); }
    const_iterator upper_bound(const value_type& item) const { return tree_.upper_bound(item); }

    template <typename OutputIt>
    OutputIt copy_to(OutputIt out) const { return std::copy(begin(), end(), out); }

    // Copies at most n elements from the front.
    template <typename OutputIt>
    OutputIt copy_to(OutputIt out, size_type n) const {
        for (auto it = begin(); n > 0 && it != end(); ++it, --n) *out++ = *it;
        return out;
    }

    // Same elements under this set's ordering.
    bool set_equals(const SortedSet& other) const {
        if (size() != other.size()) return false;
        const key_compare comp = key_comp();
        auto mine = begin();
        auto theirs = other.begin();
        for (; mine != end(); ++mine, ++theirs) {
            if (comp(*mine, *theirs) || comp(*theirs, *mine)) return false;
        }
        return true;
    }

    bool operator==(const SortedSet& other) const { return set_equals(other); }
    bool operator!=(const SortedSet& other) const { return !set_equals(other); }

    bool validate_invariants(std::string* out = nullptr) const { return tree_.validate_invariants(out); }
    void tree_dump(std::ostream& os, bool show_slots = false) const { tree_.tree_dump(os, show_slots); }

private:
    tree_type tree_;
};

template <typename T, typename Compare>
void swap(SortedSet<T, Compare>& a, SortedSet<T, Compare>& b) noexcept {
    a.swap(b);
}

// Order-independent hash of a set's members (XOR of their masked hashes); consistent with set_equals
// when Hash agrees with the set's ordering.
template <typename T, typename Compare = std::less<T>, typename Hash = std::hash<T>>
struct SortedSetHash {
    std::size_t operator()(const SortedSet<T, Compare>& s) const {
        Hash h;
        std::size_t code = 0;
        for (const T& v : s) code ^= (static_cast<std::size_t>(h(v)) & 0x7FFFFFFF);
        return code;
    }
};

#endif // SORTED_SET_HPP
