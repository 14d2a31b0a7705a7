// ordered_hash_table.hpp
// Bucket-chained hash table whose entries also form an intrusive doubly-linked order list.
//
// - C++17 header-only.
// - Storage: buckets_ (chain heads) and entries_ (hash, chain link, order links, key/value) indexed by slot.
//   Removed entries are reset and pushed on a free list threaded through their chain link.
// - Order: every live entry sits exactly once in the order list (first_order_ .. last_order_). New keys are
//   appended; move_first / move_last / move_before / move_after relink an entry in O(1).
// - Growth: when the arena is full it grows to a prime of at least twice the entry count. Only the bucket chains
//   are rebuilt; slot indices and the order list are untouched.
// - Every structural change (insert, overwrite, erase, relink, clear, trim) bumps version_. Iterators capture it
//   and throw stale_handle_error on use after a change.
// - Diagnostics: validate_invariants_json / validate_invariants / order_dump (require streamable Key and T).
//
// Usage:
//   OrderedHashTable<std::string, int> t;
//   t.insert("a", 1, true); t.insert("b", 2, true);
//   t.move_first("b");
//   for (auto it = t.begin(); it != t.end(); ++it) std::cout << it->first;   // ba

#ifndef ORDERED_HASH_TABLE_HPP
#define ORDERED_HASH_TABLE_HPP

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <functional>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "slot_arena.hpp"

template <
    typename Key,
    typename T,
    typename Hash = std::hash<Key>,
    typename KeyEqual = std::equal_to<Key>
>
class OrderedHashTable {
public:
    using key_type        = Key;
    using mapped_type     = T;
    using value_type      = std::pair<Key, T>;
    using hasher          = Hash;
    using key_equal       = KeyEqual;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using index_type      = SlotArena::index_type;
    using version_type    = SlotArena::version_type;

    static constexpr index_type npos = SlotArena::npos;

    // What insertion does when the key is already present.
    enum class InsertBehavior { ThrowOnExisting, OverwriteExisting, KeepExisting };

private:
    struct Entry {
        std::int32_t hash_code = -1;   // lower 31 bits of the hash, -1 while free
        index_type next = npos;        // bucket chain; free list while free
        index_type order_next = npos;
        index_type order_prev = npos;
        value_type kv{};
    };

public:
    // Walks the order list. The key is read-only; the mutable flavour exposes the mapped value through value().
    template <bool IsConst>
    class basic_iterator {
        friend class OrderedHashTable;
        template <bool> friend class basic_iterator;
        using table_pointer = typename std::conditional<IsConst, const OrderedHashTable*, OrderedHashTable*>::type;
    public:
        using iterator_category = std::bidirectional_iterator_tag;
        using value_type        = OrderedHashTable::value_type;
        using reference         = const value_type&;
        using pointer           = const value_type*;
        using difference_type   = OrderedHashTable::difference_type;
        using mapped_reference  = typename std::conditional<IsConst, const T&, T&>::type;

        basic_iterator() noexcept : table_(nullptr), index_(npos), version_(0) {}

        // iterator -> const_iterator
        template <bool C = IsConst, typename = typename std::enable_if<C>::type>
        basic_iterator(const basic_iterator<false>& o) noexcept
            : table_(o.table_), index_(o.index_), version_(o.version_) {}

        reference operator*() const { return entry().kv; }
        pointer operator->() const { return &entry().kv; }

        const Key& key() const { return entry().kv.first; }
        mapped_reference value() const { check(); assert(index_ != npos); return table_->entries_[index_].kv.second; }

        basic_iterator& operator++() {
            check();
            if (index_ != npos) index_ = table_->entries_[index_].order_next;
            return *this;
        }
        basic_iterator operator++(int) { basic_iterator tmp = *this; ++(*this); return tmp; }

        basic_iterator& operator--() {
            check();
            index_ = (index_ == npos) ? table_->last_order_ : table_->entries_[index_].order_prev;
            return *this;
        }
        basic_iterator operator--(int) { basic_iterator tmp = *this; --(*this); return tmp; }

        template <bool C>
        bool operator==(const basic_iterator<C>& o) const { return index_ == o.index_; }
        template <bool C>
        bool operator!=(const basic_iterator<C>& o) const { return index_ != o.index_; }

        index_type slot() const noexcept { return index_; }

    private:
        table_pointer table_;
        index_type index_;
        version_type version_;

        basic_iterator(table_pointer t, index_type i) noexcept : table_(t), index_(i), version_(t->version_) {}

        void check() const {
            if (table_ == nullptr || version_ != table_->version_) throw stale_handle_error();
        }

        const Entry& entry() const {
            check();
            assert(index_ != npos);
            return table_->entries_[index_];
        }
    };

    using iterator               = basic_iterator<false>;
    using const_iterator         = basic_iterator<true>;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    // Projects a const_iterator onto the key or the mapped value of each entry.
    template <typename V, const V& (*Project)(const value_type&)>
    class projected_iterator {
    public:
        using iterator_category = std::bidirectional_iterator_tag;
        using value_type        = V;
        using reference         = const V&;
        using pointer           = const V*;
        using difference_type   = OrderedHashTable::difference_type;

        projected_iterator() = default;
        explicit projected_iterator(const_iterator it) noexcept : it_(it) {}

        reference operator*() const { return Project(*it_); }
        pointer operator->() const { return &Project(*it_); }

        projected_iterator& operator++() { ++it_; return *this; }
        projected_iterator operator++(int) { projected_iterator tmp = *this; ++it_; return tmp; }
        projected_iterator& operator--() { --it_; return *this; }
        projected_iterator operator--(int) { projected_iterator tmp = *this; --it_; return tmp; }

        bool operator==(const projected_iterator& o) const { return it_ == o.it_; }
        bool operator!=(const projected_iterator& o) const { return it_ != o.it_; }

        const_iterator base() const noexcept { return it_; }

    private:
        const_iterator it_;
    };

    static const Key& key_of(const value_type& kv) { return kv.first; }
    static const T& mapped_of(const value_type& kv) { return kv.second; }

    using const_key_iterator   = projected_iterator<Key, &OrderedHashTable::key_of>;
    using const_value_iterator = projected_iterator<T, &OrderedHashTable::mapped_of>;

    // constructors / destructor / assignment
    explicit OrderedHashTable(size_type capacity = 0, const hasher& hash = hasher(), const key_equal& eq = key_equal())
        : hash_(hash), eq_(eq), count_(0), free_list_(npos), free_count_(0),
          first_order_(npos), last_order_(npos), version_(0)
    {
        SlotArena::check_capacity(capacity, "OrderedHashTable");
        if (capacity > 0) initialize(capacity);
    }

    OrderedHashTable(const OrderedHashTable& other)
        : buckets_(other.buckets_), entries_(other.entries_), hash_(other.hash_), eq_(other.eq_),
          count_(other.count_), free_list_(other.free_list_), free_count_(other.free_count_),
          first_order_(other.first_order_), last_order_(other.last_order_), version_(0) {}

    OrderedHashTable(OrderedHashTable&& other) noexcept
        : buckets_(std::move(other.buckets_)), entries_(std::move(other.entries_)),
          hash_(std::move(other.hash_)), eq_(std::move(other.eq_)),
          count_(other.count_), free_list_(other.free_list_), free_count_(other.free_count_),
          first_order_(other.first_order_), last_order_(other.last_order_), version_(0)
    {
        other.reset_after_move();
    }

    OrderedHashTable& operator=(const OrderedHashTable& other) {
        if (this != &other) {
            OrderedHashTable tmp(other);
            swap(tmp);
        }
        return *this;
    }

    OrderedHashTable& operator=(OrderedHashTable&& other) noexcept {
        if (this == &other) return *this;
        buckets_ = std::move(other.buckets_);
        entries_ = std::move(other.entries_);
        hash_ = std::move(other.hash_);
        eq_ = std::move(other.eq_);
        count_ = other.count_;
        free_list_ = other.free_list_;
        free_count_ = other.free_count_;
        first_order_ = other.first_order_;
        last_order_ = other.last_order_;
        ++version_;
        other.reset_after_move();
        return *this;
    }

    ~OrderedHashTable() = default;

    void swap(OrderedHashTable& other) noexcept {
        using std::swap;
        swap(buckets_, other.buckets_);
        swap(entries_, other.entries_);
        swap(hash_, other.hash_);
        swap(eq_, other.eq_);
        swap(count_, other.count_);
        swap(free_list_, other.free_list_);
        swap(free_count_, other.free_count_);
        swap(first_order_, other.first_order_);
        swap(last_order_, other.last_order_);
        ++version_;
        ++other.version_;
    }

    // capacity
    bool empty() const noexcept { return size() == 0; }
    size_type size() const noexcept { return count_ - free_count_; }
    size_type capacity() const noexcept { return entries_.size(); }
    size_type bucket_count() const noexcept { return buckets_.size(); }
    size_type max_size() const noexcept { return SlotArena::max_slots; }
    version_type version() const noexcept { return version_; }
    hasher hash_function() const { return hash_; }
    key_equal key_eq() const { return eq_; }

    // iterators
    iterator begin() noexcept { return iterator(this, first_order_); }
    const_iterator begin() const noexcept { return const_iterator(this, first_order_); }
    const_iterator cbegin() const noexcept { return begin(); }
    iterator end() noexcept { return iterator(this, npos); }
    const_iterator end() const noexcept { return const_iterator(this, npos); }
    const_iterator cend() const noexcept { return end(); }

    reverse_iterator rbegin() noexcept { return reverse_iterator(end()); }
    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator(end()); }
    reverse_iterator rend() noexcept { return reverse_iterator(begin()); }
    const_reverse_iterator rend() const noexcept { return const_reverse_iterator(begin()); }

    // Forward walk starting at key; end() when key is absent.
    iterator begin(const key_type& key) { return iterator(this, find_entry(key)); }
    const_iterator begin(const key_type& key) const { return const_iterator(this, find_entry(key)); }

    // Reverse walk starting at key (key first, then its predecessors); rend() when key is absent.
    reverse_iterator rbegin(const key_type& key) {
        index_type i = find_entry(key);
        if (i == npos) return rend();
        return reverse_iterator(iterator(this, entries_[i].order_next));
    }
    const_reverse_iterator rbegin(const key_type& key) const {
        index_type i = find_entry(key);
        if (i == npos) return rend();
        return const_reverse_iterator(const_iterator(this, entries_[i].order_next));
    }

    const_key_iterator key_begin() const noexcept { return const_key_iterator(begin()); }
    const_key_iterator key_end() const noexcept { return const_key_iterator(end()); }
    const_value_iterator value_begin() const noexcept { return const_value_iterator(begin()); }
    const_value_iterator value_end() const noexcept { return const_value_iterator(end()); }

    // modifiers

    // Adds key -> value. With add == true an existing key throws duplicate_key_error; otherwise its value is
    // overwritten in place (order unchanged). Returns true if a new entry was created.
    bool insert(const key_type& key, const mapped_type& value, bool add) {
        return emplace_entry(key, value, add ? InsertBehavior::ThrowOnExisting : InsertBehavior::OverwriteExisting).second;
    }
    bool insert(key_type&& key, mapped_type&& value, bool add) {
        return emplace_entry(std::move(key), std::move(value),
                             add ? InsertBehavior::ThrowOnExisting : InsertBehavior::OverwriteExisting).second;
    }

    // Adds key -> value unless key exists. Returns the entry's slot and whether it was created.
    std::pair<index_type, bool> try_insert(const key_type& key, const mapped_type& value) {
        return emplace_entry(key, value, InsertBehavior::KeepExisting);
    }
    std::pair<index_type, bool> try_insert(key_type&& key, mapped_type&& value) {
        return emplace_entry(std::move(key), std::move(value), InsertBehavior::KeepExisting);
    }

    bool erase(const key_type& key) { return erase_impl(key, nullptr); }

    // As erase(key), moving the removed value into out first.
    bool erase(const key_type& key, mapped_type& out) { return erase_impl(key, &out); }

    // Releases every entry but keeps the arrays for reuse.
    void clear() {
        if (count_ > 0) {
            std::fill(buckets_.begin(), buckets_.end(), npos);
            for (size_type i = 0; i < count_; ++i) entries_[i] = Entry();
            count_ = 0;
            free_list_ = npos;
            free_count_ = 0;
            first_order_ = npos;
            last_order_ = npos;
        }
        ++version_;
    }

    // Reallocates to the smallest prime that holds the live entries, packing them in order.
    void trim_excess() {
        size_type live = size();
        if (live == 0) {
            std::vector<index_type>().swap(buckets_);
            std::vector<Entry>().swap(entries_);
            count_ = 0;
            free_list_ = npos;
            free_count_ = 0;
            first_order_ = npos;
            last_order_ = npos;
            ++version_;
            return;
        }

        size_type new_size = SlotArena::prime_at_least(live);
        std::vector<index_type> buckets(new_size, npos);
        std::vector<Entry> packed(new_size);
        index_type k = 0;
        for (index_type i = first_order_; i != npos; i = entries_[i].order_next, ++k) {
            Entry& e = packed[k];
            e.hash_code = entries_[i].hash_code;
            e.kv = std::move(entries_[i].kv);
            e.order_prev = (k == 0) ? npos : k - 1;
            e.order_next = (k + 1 == live) ? npos : k + 1;
            size_type b = static_cast<size_type>(e.hash_code) % new_size;
            e.next = buckets[b];
            buckets[b] = k;
        }
        buckets_.swap(buckets);
        entries_.swap(packed);
        count_ = live;
        free_list_ = npos;
        free_count_ = 0;
        first_order_ = 0;
        last_order_ = static_cast<index_type>(live - 1);
        ++version_;
    }

    // Relinks key at the front of the order list. Returns false when key is absent.
    bool move_first(const key_type& key) {
        index_type index = find_entry(key);
        if (index == npos) return false;
        if (entries_[index].order_prev != npos) {
            unlink_order(index);
            entries_[index].order_prev = npos;
            entries_[index].order_next = first_order_;
            entries_[first_order_].order_prev = index;
            first_order_ = index;
            ++version_;
        }
        return true;
    }

    // Relinks key at the back of the order list. Returns false when key is absent.
    bool move_last(const key_type& key) {
        index_type index = find_entry(key);
        if (index == npos) return false;
        if (entries_[index].order_next != npos) {
            unlink_order(index);
            entries_[index].order_next = npos;
            entries_[index].order_prev = last_order_;
            entries_[last_order_].order_next = index;
            last_order_ = index;
            ++version_;
        }
        return true;
    }

    // Relinks key directly before mark. Returns false when key is absent; a missing mark or
    // mark == key leaves the order unchanged.
    bool move_before(const key_type& key, const key_type& mark) {
        index_type index = find_entry(key);
        if (index == npos) return false;
        index_type mark_index = find_entry(mark);
        if (mark_index == npos || mark_index == index) return true;

        unlink_order(index);
        index_type pre_mark = entries_[mark_index].order_prev;
        entries_[index].order_next = mark_index;
        entries_[index].order_prev = pre_mark;
        entries_[mark_index].order_prev = index;
        if (pre_mark == npos) first_order_ = index;
        else entries_[pre_mark].order_next = index;
        ++version_;
        return true;
    }

    // Relinks key directly after mark. Same return rules as move_before.
    bool move_after(const key_type& key, const key_type& mark) {
        index_type index = find_entry(key);
        if (index == npos) return false;
        index_type mark_index = find_entry(mark);
        if (mark_index == npos || mark_index == index) return true;

        unlink_order(index);
        index_type post_mark = entries_[mark_index].order_next;
        entries_[index].order_prev = mark_index;
        entries_[index].order_next = post_mark;
        entries_[mark_index].order_next = index;
        if (post_mark == npos) last_order_ = index;
        else entries_[post_mark].order_prev = index;
        ++version_;
        return true;
    }

    // lookup
    index_type find_entry(const key_type& key) const {
        if (buckets_.empty()) return npos;
        std::int32_t h = hash_of(key);
        for (index_type i = buckets_[bucket_of(h)]; i != npos; i = entries_[i].next) {
            if (entries_[i].hash_code == h && eq_(entries_[i].kv.first, key)) return i;
        }
        return npos;
    }

    bool contains(const key_type& key) const { return find_entry(key) != npos; }

    // Pointer to the mapped value, or nullptr when key is absent. Valid until the next structural change.
    const mapped_type* try_get(const key_type& key) const {
        index_type i = find_entry(key);
        return i == npos ? nullptr : &entries_[i].kv.second;
    }
    mapped_type* try_get(const key_type& key) {
        index_type i = find_entry(key);
        return i == npos ? nullptr : &entries_[i].kv.second;
    }

    // Linear scan in order; requires T::operator==.
    bool contains_value(const mapped_type& value) const {
        for (index_type i = first_order_; i != npos; i = entries_[i].order_next) {
            if (entries_[i].kv.second == value) return true;
        }
        return false;
    }

    const value_type& entry_at(index_type i) const { return entries_[i].kv; }
    mapped_type& mapped_at(index_type i) { return entries_[i].kv.second; }

    // validate_invariants_json:
    // Checks order-list integrity (links, ends, length), bucket chains (slot range, bucket placement, stored hash),
    // free-list accounting and key uniqueness. Writes a JSON object to out_json:
    // {
    //   "valid": true|false, "size": n, "count": c, "free_count": f, "capacity": cap, "bucket_count": b,
    //   "issues": [ ... ],
    //   "order": [ { "slot": i, "key": "...", "value": "...", "prev": p|null, "next": n|null }, ... ]
    // }
    bool validate_invariants_json(std::string& out_json) const {
        std::vector<std::string> issues;

        if (buckets_.size() != entries_.size()) issues.push_back("bucket and entry arrays differ in length");
        if (count_ > entries_.size()) issues.push_back("count beyond capacity");
        if (free_count_ > count_) issues.push_back("free_count beyond count");

        bool structural_ok = issues.empty();
        std::vector<std::string> order_jsons;

        if (structural_ok) {
            // 0 = unseen, 1 = in order list, 2 = on free list
            std::vector<unsigned char> state(count_, 0);

            // order list
            size_type walked = 0;
            index_type prev = npos;
            for (index_type i = first_order_; i != npos; i = entries_[i].order_next) {
                if (i >= count_) {
                    issues.push_back("order link out of range: " + SlotArena::index_to_string(i));
                    break;
                }
                if (state[i] != 0) {
                    issues.push_back("order list revisits slot " + SlotArena::index_to_string(i));
                    break;
                }
                state[i] = 1;
                ++walked;
                const Entry& e = entries_[i];
                if (e.hash_code < 0) issues.push_back("free slot in order list: " + SlotArena::index_to_string(i));
                if (e.order_prev != prev) issues.push_back("order_prev mismatch at slot " + SlotArena::index_to_string(i));

                std::ostringstream oj;
                oj << "{\"slot\":" << i
                   << ",\"key\":" << SlotArena::json_escape_and_quote(SlotArena::to_display_string(e.kv.first))
                   << ",\"value\":" << SlotArena::json_escape_and_quote(SlotArena::to_display_string(e.kv.second))
                   << ",\"prev\":" << SlotArena::index_to_string(e.order_prev)
                   << ",\"next\":" << SlotArena::index_to_string(e.order_next) << "}";
                order_jsons.push_back(oj.str());
                prev = i;
            }
            if (prev != last_order_) issues.push_back("last_order does not end the order list");
            if (walked != size()) {
                std::ostringstream oss;
                oss << "order list length " << walked << " != size " << size();
                issues.push_back(oss.str());
            }

            // bucket chains
            size_type chained = 0;
            for (size_type b = 0; b < buckets_.size() && chained <= count_; ++b) {
                for (index_type i = buckets_[b]; i != npos; i = entries_[i].next) {
                    if (i >= count_ || ++chained > count_) {
                        issues.push_back("bucket chain broken at bucket " + std::to_string(b));
                        break;
                    }
                    const Entry& e = entries_[i];
                    if (state[i] != 1) issues.push_back("chained slot not in order list: " + SlotArena::index_to_string(i));
                    if (e.hash_code != hash_of(e.kv.first)) issues.push_back("stale hash at slot " + SlotArena::index_to_string(i));
                    else if (bucket_of(e.hash_code) != b) issues.push_back("slot in wrong bucket: " + SlotArena::index_to_string(i));
                    if (find_entry(e.kv.first) != i) issues.push_back("duplicate key at slot " + SlotArena::index_to_string(i));
                }
            }
            if (chained != size()) {
                std::ostringstream oss;
                oss << "bucket chains hold " << chained << " entries, size is " << size();
                issues.push_back(oss.str());
            }

            // free list
            size_type freed = 0;
            for (index_type i = free_list_; i != npos; i = entries_[i].next) {
                if (i >= count_ || state[i] != 0) {
                    issues.push_back("free list broken at slot " + SlotArena::index_to_string(i));
                    break;
                }
                state[i] = 2;
                ++freed;
                if (entries_[i].hash_code != -1) issues.push_back("free slot keeps a hash: " + SlotArena::index_to_string(i));
            }
            if (freed != free_count_) {
                std::ostringstream oss;
                oss << "free list length " << freed << " != free_count " << free_count_;
                issues.push_back(oss.str());
            }
        }

        bool valid = issues.empty();
        std::ostringstream out;
        out << "{";
        out << "\"valid\":" << (valid ? "true" : "false") << ",";
        out << "\"size\":" << size() << ",";
        out << "\"count\":" << count_ << ",";
        out << "\"free_count\":" << free_count_ << ",";
        out << "\"capacity\":" << entries_.size() << ",";
        out << "\"bucket_count\":" << buckets_.size() << ",";
        out << "\"issues\":[";
        for (size_t i = 0; i < issues.size(); ++i) {
            out << SlotArena::json_escape_and_quote(issues[i]);
            if (i + 1 < issues.size()) out << ",";
        }
        out << "],\"order\":[";
        for (size_t i = 0; i < order_jsons.size(); ++i) {
            out << order_jsons[i];
            if (i + 1 < order_jsons.size()) out << ",";
        }
        out << "]}";
        out_json = out.str();
        return valid;
    }

    bool validate_invariants(std::string* out = nullptr) const {
        std::string json;
        bool ok = validate_invariants_json(json);
        if (!out) return ok;
        std::ostringstream oss;
        oss << "validate_invariants: valid=" << (ok ? "true" : "false") << "\n";
        oss << "JSON diagnostics:\n" << json << "\n";
        if (ok) oss << "Order dump:\n" << order_dump_to_string() << "\n";
        *out = oss.str();
        return ok;
    }

    // One line per entry in order: "#slot key => value".
    void order_dump(std::ostream& os) const { os << order_dump_to_string(); }

    std::string order_dump_to_string() const {
        std::ostringstream oss;
        if (first_order_ == npos) {
            oss << "<empty>\n";
            return oss.str();
        }
        for (index_type i = first_order_; i != npos; i = entries_[i].order_next) {
            oss << "#" << i << " " << SlotArena::to_display_string(entries_[i].kv.first)
                << " => " << SlotArena::to_display_string(entries_[i].kv.second) << "\n";
        }
        return oss.str();
    }

private:
    std::vector<index_type> buckets_;
    std::vector<Entry> entries_;
    hasher hash_;
    key_equal eq_;
    size_type count_;           // slots handed out so far (live + free)
    index_type free_list_;
    size_type free_count_;
    index_type first_order_;
    index_type last_order_;
    version_type version_;

    std::int32_t hash_of(const key_type& key) const {
        return static_cast<std::int32_t>(static_cast<std::size_t>(hash_(key)) & 0x7FFFFFFF);
    }

    size_type bucket_of(std::int32_t hash_code) const {
        return static_cast<size_type>(hash_code) % buckets_.size();
    }

    void initialize(size_type capacity) {
        size_type size = SlotArena::prime_at_least(capacity);
        buckets_.assign(size, npos);
        entries_.assign(size, Entry());
        free_list_ = npos;
        first_order_ = npos;
        last_order_ = npos;
    }

    template <typename K, typename V>
    std::pair<index_type, bool> emplace_entry(K&& key, V&& value, InsertBehavior behavior) {
        if (buckets_.empty()) initialize(0);
        std::int32_t h = hash_of(key);

        for (index_type i = buckets_[bucket_of(h)]; i != npos; i = entries_[i].next) {
            if (entries_[i].hash_code == h && eq_(entries_[i].kv.first, key)) {
                if (behavior == InsertBehavior::ThrowOnExisting) {
                    throw duplicate_key_error("OrderedHashTable: an item with the same key has already been added");
                }
                if (behavior == InsertBehavior::OverwriteExisting) {
                    entries_[i].kv.second = std::forward<V>(value);
                    ++version_;
                }
                return { i, false };
            }
        }

        if (free_count_ == 0 && count_ == entries_.size()) {
            // key or value may live inside entries_: take them out before the array moves
            value_type staged(std::forward<K>(key), std::forward<V>(value));
            resize(SlotArena::expand_prime(count_));
            return { link_new_entry(h, std::move(staged.first), std::move(staged.second)), true };
        }
        return { link_new_entry(h, std::forward<K>(key), std::forward<V>(value)), true };
    }

    // Fills a free (or fresh) slot and links it into its bucket and at the back of the order list.
    template <typename K, typename V>
    index_type link_new_entry(std::int32_t h, K&& key, V&& value) {
        index_type index = (free_count_ > 0) ? free_list_ : static_cast<index_type>(count_);
        Entry& e = entries_[index];
        e.kv.first = std::forward<K>(key);
        e.kv.second = std::forward<V>(value);

        if (free_count_ > 0) {
            free_list_ = e.next;
            --free_count_;
        } else {
            ++count_;
        }

        size_type target = bucket_of(h);
        e.hash_code = h;
        e.next = buckets_[target];
        buckets_[target] = index;

        e.order_next = npos;
        e.order_prev = last_order_;
        if (last_order_ != npos) entries_[last_order_].order_next = index;
        else first_order_ = index;
        last_order_ = index;

        ++version_;
        return index;
    }

    // Grows both arrays to new_size and rebuilds the bucket chains. Only called with no free slots.
    void resize(size_type new_size) {
        assert(new_size >= entries_.size());
        assert(free_count_ == 0);
        std::vector<index_type> buckets(new_size, npos);
        entries_.resize(new_size);
        for (size_type i = 0; i < count_; ++i) {
            Entry& e = entries_[i];
            if (e.hash_code >= 0) {
                size_type b = static_cast<size_type>(e.hash_code) % new_size;
                e.next = buckets[b];
                buckets[b] = static_cast<index_type>(i);
            }
        }
        buckets_.swap(buckets);
    }

    bool erase_impl(const key_type& key, mapped_type* out) {
        if (buckets_.empty()) return false;
        std::int32_t h = hash_of(key);
        size_type bucket = bucket_of(h);
        index_type last = npos;
        for (index_type i = buckets_[bucket]; i != npos; last = i, i = entries_[i].next) {
            Entry& e = entries_[i];
            if (e.hash_code != h || !eq_(e.kv.first, key)) continue;

            if (out) *out = std::move(e.kv.second);

            if (last == npos) buckets_[bucket] = e.next;
            else entries_[last].next = e.next;
            unlink_order(i);

            // key may refer to e.kv.first: not used past this point
            e.hash_code = -1;
            e.kv.first = key_type();
            e.kv.second = mapped_type();
            e.order_next = npos;
            e.order_prev = npos;
            e.next = free_list_;
            free_list_ = i;
            ++free_count_;
            ++version_;
            return true;
        }
        return false;
    }

    // Detaches index from the order list; its own order links are left for the caller to overwrite.
    void unlink_order(index_type index) {
        index_type next = entries_[index].order_next;
        index_type prev = entries_[index].order_prev;
        if (prev == npos) first_order_ = next;
        else entries_[prev].order_next = next;
        if (next == npos) last_order_ = prev;
        else entries_[next].order_prev = prev;
    }

    void reset_after_move() noexcept {
        buckets_.clear();
        entries_.clear();
        count_ = 0;
        free_list_ = npos;
        free_count_ = 0;
        first_order_ = npos;
        last_order_ = npos;
        ++version_;
    }
};

#endif // ORDERED_HASH_TABLE_HPP
