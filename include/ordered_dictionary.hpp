// ordered_dictionary.hpp
// Key -> value map that remembers insertion order and lets callers reorder entries in O(1).
// Thin adapter over OrderedHashTable; see ordered_hash_table.hpp for storage and invalidation rules.
//
// Usage:
//   OrderedDictionary<std::string, int> d;
//   d.add("one", 1); d.add("two", 2); d["three"] = 3;
//   d.move_before("three", "one");
//   for (const auto& kv : d) ...                 // three one two
//   for (const auto& k : d.keys().reversed()) ... // two one three
//
// Values written through operator[], at() or iterator::value() are not structural changes and leave
// iterators valid; insert_or_assign() on an existing key is, and invalidates them.

#ifndef ORDERED_DICTIONARY_HPP
#define ORDERED_DICTIONARY_HPP

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

#include "ordered_hash_table.hpp"

template <
    typename Key,
    typename T,
    typename Hash = std::hash<Key>,
    typename KeyEqual = std::equal_to<Key>
>
class OrderedDictionary {
    using table_type = OrderedHashTable<Key, T, Hash, KeyEqual>;

public:
    using key_type               = Key;
    using mapped_type            = T;
    using value_type             = typename table_type::value_type;
    using hasher                 = Hash;
    using key_equal              = KeyEqual;
    using size_type              = typename table_type::size_type;
    using version_type           = typename table_type::version_type;
    using iterator               = typename table_type::iterator;
    using const_iterator         = typename table_type::const_iterator;
    using reverse_iterator       = typename table_type::reverse_iterator;
    using const_reverse_iterator = typename table_type::const_reverse_iterator;
    using const_key_iterator     = typename table_type::const_key_iterator;
    using const_value_iterator   = typename table_type::const_value_iterator;

    // Keys in order. Restartable; reflects later changes to the dictionary.
    class key_view {
    public:
        using const_reverse_iterator = std::reverse_iterator<const_key_iterator>;

        explicit key_view(const OrderedDictionary& d) noexcept : dict_(&d) {}

        const_key_iterator begin() const { return dict_->table_.key_begin(); }
        const_key_iterator end() const { return dict_->table_.key_end(); }
        const_reverse_iterator rbegin() const { return const_reverse_iterator(end()); }
        const_reverse_iterator rend() const { return const_reverse_iterator(begin()); }

        size_type size() const noexcept { return dict_->size(); }
        bool empty() const noexcept { return dict_->empty(); }
        bool contains(const key_type& key) const { return dict_->contains_key(key); }

        template <typename OutputIt>
        OutputIt copy_to(OutputIt out) const { return std::copy(begin(), end(), out); }

        // Keys in reverse order.
        class reverse_range {
        public:
            explicit reverse_range(const OrderedDictionary& d) noexcept : dict_(&d) {}
            const_reverse_iterator begin() const { return dict_->keys().rbegin(); }
            const_reverse_iterator end() const { return dict_->keys().rend(); }
        private:
            const OrderedDictionary* dict_;
        };
        reverse_range reversed() const noexcept { return reverse_range(*dict_); }

    private:
        const OrderedDictionary* dict_;
    };

    // Values in key order.
    class value_view {
    public:
        using const_reverse_iterator = std::reverse_iterator<const_value_iterator>;

        explicit value_view(const OrderedDictionary& d) noexcept : dict_(&d) {}

        const_value_iterator begin() const { return dict_->table_.value_begin(); }
        const_value_iterator end() const { return dict_->table_.value_end(); }
        const_reverse_iterator rbegin() const { return const_reverse_iterator(end()); }
        const_reverse_iterator rend() const { return const_reverse_iterator(begin()); }

        size_type size() const noexcept { return dict_->size(); }
        bool empty() const noexcept { return dict_->empty(); }
        bool contains(const mapped_type& value) const { return dict_->contains_value(value); }

        template <typename OutputIt>
        OutputIt copy_to(OutputIt out) const { return std::copy(begin(), end(), out); }

    private:
        const OrderedDictionary* dict_;
    };

    // Read-only view that enumerates last to first.
    class reverse_view {
    public:
        explicit reverse_view(const OrderedDictionary& d) noexcept : dict_(&d) {}

        const_reverse_iterator begin() const { return dict_->rbegin(); }
        const_reverse_iterator end() const { return dict_->rend(); }

        size_type size() const noexcept { return dict_->size(); }
        bool contains_key(const key_type& key) const { return dict_->contains_key(key); }
        const mapped_type& at(const key_type& key) const { return dict_->at(key); }

    private:
        const OrderedDictionary* dict_;
    };

    explicit OrderedDictionary(size_type capacity = 0, const hasher& hash = hasher(), const key_equal& eq = key_equal())
        : table_(capacity, hash, eq) {}

    // Adds every pair of [first, last) in sequence order. A repeated key throws duplicate_key_error.
    template <typename InputIt>
    OrderedDictionary(InputIt first, InputIt last, size_type capacity = 0,
                      const hasher& hash = hasher(), const key_equal& eq = key_equal())
        : table_(capacity, hash, eq)
    {
        for (; first != last; ++first) add(first->first, first->second);
    }

    OrderedDictionary(std::initializer_list<value_type> init,
                      const hasher& hash = hasher(), const key_equal& eq = key_equal())
        : OrderedDictionary(init.begin(), init.end(), init.size(), hash, eq) {}

    // capacity
    bool empty() const noexcept { return table_.empty(); }
    size_type size() const noexcept { return table_.size(); }
    size_type capacity() const noexcept { return table_.capacity(); }
    version_type version() const noexcept { return table_.version(); }
    hasher hash_function() const { return table_.hash_function(); }
    key_equal key_eq() const { return table_.key_eq(); }

    // iterators
    iterator begin() noexcept { return table_.begin(); }
    const_iterator begin() const noexcept { return table_.begin(); }
    iterator end() noexcept { return table_.end(); }
    const_iterator end() const noexcept { return table_.end(); }
    reverse_iterator rbegin() noexcept { return table_.rbegin(); }
    const_reverse_iterator rbegin() const noexcept { return table_.rbegin(); }
    reverse_iterator rend() noexcept { return table_.rend(); }
    const_reverse_iterator rend() const noexcept { return table_.rend(); }

    // Enumeration starting at key (inclusive); empty when key is absent.
    iterator begin(const key_type& key) { return table_.begin(key); }
    const_iterator begin(const key_type& key) const { return table_.begin(key); }
    reverse_iterator rbegin(const key_type& key) { return table_.rbegin(key); }
    const_reverse_iterator rbegin(const key_type& key) const { return table_.rbegin(key); }

    key_view keys() const noexcept { return key_view(*this); }
    value_view values() const noexcept { return value_view(*this); }
    reverse_view reversed() const noexcept { return reverse_view(*this); }

    // modifiers

    // Throws duplicate_key_error when key is already present.
    void add(const key_type& key, const mapped_type& value) { table_.insert(key, value, true); }
    void add(key_type&& key, mapped_type&& value) { table_.insert(std::move(key), std::move(value), true); }

    // Returns false (and leaves the dictionary unchanged) when key is already present.
    bool try_add(const key_type& key, const mapped_type& value) { return table_.try_insert(key, value).second; }
    bool try_add(key_type&& key, mapped_type&& value) { return table_.try_insert(std::move(key), std::move(value)).second; }

    // Overwrites in place when key exists (order unchanged). Returns true if a new entry was created.
    bool insert_or_assign(const key_type& key, const mapped_type& value) { return table_.insert(key, value, false); }
    bool insert_or_assign(key_type&& key, mapped_type&& value) { return table_.insert(std::move(key), std::move(value), false); }

    // Appends a default value when key is absent.
    mapped_type& operator[](const key_type& key) {
        return table_.mapped_at(table_.try_insert(key, mapped_type()).first);
    }
    mapped_type& operator[](key_type&& key) {
        return table_.mapped_at(table_.try_insert(std::move(key), mapped_type()).first);
    }

    mapped_type& at(const key_type& key) {
        mapped_type* v = table_.try_get(key);
        if (!v) throw std::out_of_range("OrderedDictionary::at: key not found");
        return *v;
    }

    const mapped_type& at(const key_type& key) const {
        const mapped_type* v = table_.try_get(key);
        if (!v) throw std::out_of_range("OrderedDictionary::at: key not found");
        return *v;
    }

    bool remove(const key_type& key) { return table_.erase(key); }
    bool remove(const key_type& key, mapped_type& out) { return table_.erase(key, out); }

    void clear() { table_.clear(); }
    void trim_excess() { table_.trim_excess(); }

    void swap(OrderedDictionary& other) noexcept { table_.swap(other.table_); }

    // reordering: each returns whether key exists
    bool move_first(const key_type& key) { return table_.move_first(key); }
    bool move_last(const key_type& key) { return table_.move_last(key); }
    bool move_before(const key_type& key, const key_type& mark) { return table_.move_before(key, mark); }
    bool move_after(const key_type& key, const key_type& mark) { return table_.move_after(key, mark); }

    // lookup
    bool contains_key(const key_type& key) const { return table_.contains(key); }
    bool contains_value(const mapped_type& value) const { return table_.contains_value(value); }
    size_type count(const key_type& key) const { return table_.contains(key) ? 1 : 0; }

    bool try_get_value(const key_type& key, mapped_type& out) const {
        const mapped_type* v = table_.try_get(key);
        if (!v) return false;
        out = *v;
        return true;
    }

    mapped_type get_value_or_default(const key_type& key) const {
        const mapped_type* v = table_.try_get(key);
        return v ? *v : mapped_type();
    }

    // Copies the (key, value) pairs in order.
    template <typename OutputIt>
    OutputIt copy_to(OutputIt out) const { return std::copy(begin(), end(), out); }

    // diagnostics
    bool validate_invariants(std::string* out = nullptr) const { return table_.validate_invariants(out); }
    bool validate_invariants_json(std::string& out_json) const { return table_.validate_invariants_json(out_json); }
    void order_dump(std::ostream& os) const { table_.order_dump(os); }

private:
    table_type table_;
};

template <typename Key, typename T, typename Hash, typename KeyEqual>
void swap(OrderedDictionary<Key, T, Hash, KeyEqual>& a, OrderedDictionary<Key, T, Hash, KeyEqual>& b) noexcept {
    a.swap(b);
}

#endif // ORDERED_DICTIONARY_HPP
