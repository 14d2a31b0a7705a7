// ordered_hash_set.hpp
// Hash set that enumerates in insertion order and supports O(1) reordering.
// Stores its elements as keys of an OrderedHashTable with an empty mapped type.

#ifndef ORDERED_HASH_SET_HPP
#define ORDERED_HASH_SET_HPP

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <string>
#include <utility>

#include "ordered_hash_table.hpp"

template <
    typename T,
    typename Hash = std::hash<T>,
    typename KeyEqual = std::equal_to<T>
>
class OrderedHashSet {
    using table_type = OrderedHashTable<T, SlotArenaUnit, Hash, KeyEqual>;

public:
    using value_type             = T;
    using key_type               = T;
    using hasher                 = Hash;
    using key_equal              = KeyEqual;
    using size_type              = typename table_type::size_type;
    using version_type           = typename table_type::version_type;
    using const_iterator         = typename table_type::const_key_iterator;
    using iterator               = const_iterator;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;
    using reverse_iterator       = const_reverse_iterator;

    class reverse_view {
    public:
        explicit reverse_view(const OrderedHashSet& s) noexcept : set_(&s) {}
        const_reverse_iterator begin() const { return set_->rbegin(); }
        const_reverse_iterator end() const { return set_->rend(); }
        size_type size() const noexcept { return set_->size(); }
        bool contains(const value_type& item) const { return set_->contains(item); }
    private:
        const OrderedHashSet* set_;
    };

    explicit OrderedHashSet(size_type capacity = 0, const hasher& hash = hasher(), const key_equal& eq = key_equal())
        : table_(capacity, hash, eq) {}

    // Adds the elements of [first, last) in sequence order; repeats are skipped.
    template <typename InputIt>
    OrderedHashSet(InputIt first, InputIt last, size_type capacity = 0,
                   const hasher& hash = hasher(), const key_equal& eq = key_equal())
        : table_(capacity, hash, eq)
    {
        for (; first != last; ++first) add(*first);
    }

    OrderedHashSet(std::initializer_list<value_type> init,
                   const hasher& hash = hasher(), const key_equal& eq = key_equal())
        : OrderedHashSet(init.begin(), init.end(), init.size(), hash, eq) {}

    bool empty() const noexcept { return table_.empty(); }
    size_type size() const noexcept { return table_.size(); }
    size_type capacity() const noexcept { return table_.capacity(); }
    version_type version() const noexcept { return table_.version(); }

    const_iterator begin() const noexcept { return table_.key_begin(); }
    const_iterator end() const noexcept { return table_.key_end(); }
    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator(end()); }
    const_reverse_iterator rend() const noexcept { return const_reverse_iterator(begin()); }

    // Enumeration starting at item (inclusive); empty when item is absent.
    const_iterator begin(const value_type& item) const { return const_iterator(table_.begin(item)); }
    const_reverse_iterator rbegin(const value_type& item) const {
        if (!table_.contains(item)) return rend();
        return const_reverse_iterator(std::next(begin(item)));
    }

    reverse_view reversed() const noexcept { return reverse_view(*this); }

    // Appends item; false when it is already present.
    bool add(const value_type& item) { return table_.try_insert(item, SlotArenaUnit()).second; }
    bool add(value_type&& item) { return table_.try_insert(std::move(item), SlotArenaUnit()).second; }

    bool remove(const value_type& item) { return table_.erase(item); }
    bool contains(const value_type& item) const { return table_.contains(item); }
    size_type count(const value_type& item) const { return table_.contains(item) ? 1 : 0; }

    void clear() { table_.clear(); }
    void trim_excess() { table_.trim_excess(); }
    void swap(OrderedHashSet& other) noexcept { table_.swap(other.table_); }

    bool move_first(const value_type& item) { return table_.move_first(item); }
    bool move_last(const value_type& item) { return table_.move_last(item); }
    bool move_before(const value_type& item, const value_type& mark) { return table_.move_before(item, mark); }
    bool move_after(const value_type& item, const value_type& mark) { return table_.move_after(item, mark); }

    template <typename OutputIt>
    OutputIt copy_to(OutputIt out) const { return std::copy(begin(), end(), out); }

    bool validate_invariants(std::string* out = nullptr) const { return table_.validate_invariants(out); }
    void order_dump(std::ostream& os) const { table_.order_dump(os); }

private:
    table_type table_;
};

template <typename T, typename Hash, typename KeyEqual>
void swap(OrderedHashSet<T, Hash, KeyEqual>& a, OrderedHashSet<T, Hash, KeyEqual>& b) noexcept {
    a.swap(b);
}

#endif // ORDERED_HASH_SET_HPP
