// red_black_slot_tree.hpp
// Red-Black tree whose nodes live in a flat slot arena addressed by integer indices instead of heap pointers.
//
// - C++17 header-only.
// - Storage: two parallel arrays, items_ (the elements) and slots_ (left/right/parent/color), indexed by slot.
//   Vacated slots are threaded into a free list through their parent field and reused before the arena grows.
//   The arena grows by doubling (floor SlotArena::min_capacity) and shrinks only on trim_excess().
// - Algorithms are top-down (2-3-4 tree view):
//     * insert splits 4-nodes on the way down and fixes red-red pairs with a single or double rotation.
//     * erase never steps onto a 2-node: a red sibling is rotated in, a 2-node sibling is merged by a color flip,
//       otherwise one of four rotations (TreeRotation) lends a red link. The matching slot is replaced by its
//       in-order successor and returned to the free list.
// - Traversal uses parent links only (no recursion, no stack).
// - Every structural change bumps version_. const_iterator and node_type capture it and throw stale_handle_error
//   when used after the tree changed.
// - Diagnostics:
//     * validate_invariants_json(std::string& out_json) const
//         - Validates RB properties, BST order, parent/child consistency, size, and free-list/live-slot disjointness.
//         - Produces a JSON object with validity, issues, counts, black-height and per-slot detail.
//     * validate_invariants(std::string* out) const - human-readable wrapper.
//     * tree_dump(std::ostream& os, bool show_slots = false) const - indented structure dump.
//   These assume T is streamable (operator<<); they are only instantiated when called.
//
// Usage:
//   RBSlotTree<int> t;
//   t.insert(3); t.insert(1); t.insert(2);
//   auto n = t.find_next(1);              // node_type holding 2
//   for (int v : t.reversed()) ...        // 3 2 1

#ifndef RED_BLACK_SLOT_TREE_HPP
#define RED_BLACK_SLOT_TREE_HPP

#include <algorithm>
#include <cassert>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "slot_arena.hpp"

template <
    typename T,
    typename Compare = std::less<T>
>
class RBSlotTree {
public:
    // STL-like typedefs
    using value_type      = T;
    using key_type        = T;
    using key_compare     = Compare;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using index_type      = SlotArena::index_type;
    using version_type    = SlotArena::version_type;

    static constexpr index_type npos = SlotArena::npos;

private:
    enum Color : unsigned char { RED = 1, BLACK = 0 };

    enum class TreeRotation { Left = 1, Right = 2, RightLeft = 3, LeftRight = 4 };

    // Links of one slot; the element lives in items_ at the same index.
    // While the slot is free, parent holds the next free slot.
    struct Slot {
        index_type left;
        index_type right;
        index_type parent;
        Color color;
    };

    static Slot blank_slot() noexcept { return Slot{npos, npos, npos, BLACK}; }

public:
    // Elements are keys, so only a const iterator is offered.
    class const_iterator {
        friend class RBSlotTree;
    public:
        using iterator_category = std::bidirectional_iterator_tag;
        using value_type        = RBSlotTree::value_type;
        using reference         = const value_type&;
        using pointer           = const value_type*;
        using difference_type   = RBSlotTree::difference_type;

        const_iterator() noexcept : tree_(nullptr), index_(npos), version_(0) {}

        reference operator*() const { check(); assert(index_ != npos); return tree_->items_[index_]; }
        pointer operator->() const { check(); assert(index_ != npos); return &tree_->items_[index_]; }

        const_iterator& operator++() { check(); index_ = tree_->next_slot(index_); return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++(*this); return tmp; }

        const_iterator& operator--() {
            check();
            if (index_ == npos) index_ = tree_->last_slot();
            else index_ = tree_->previous_slot(index_);
            return *this;
        }
        const_iterator operator--(int) { const_iterator tmp = *this; --(*this); return tmp; }

        bool operator==(const const_iterator& o) const { return index_ == o.index_; }
        bool operator!=(const const_iterator& o) const { return index_ != o.index_; }

    private:
        const RBSlotTree* tree_;
        index_type index_;
        version_type version_;

        const_iterator(const RBSlotTree* t, index_type i) noexcept : tree_(t), index_(i), version_(t->version_) {}

        void check() const {
            if (tree_ == nullptr || version_ != tree_->version_) throw stale_handle_error();
        }
    };

    using iterator = const_iterator;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;
    using reverse_iterator = const_reverse_iterator;

    // Version-stamped cursor (tree, slot, version). A null node stands for "no such element".
    class node_type {
        friend class RBSlotTree;
    public:
        node_type() noexcept : tree_(nullptr), index_(npos), version_(0) {}

        bool is_null() const noexcept { return index_ == npos; }
        explicit operator bool() const noexcept { return index_ != npos; }

        const value_type& value() const {
            check();
            if (index_ == npos) throw std::out_of_range("RBSlotTree::node_type::value: node is null");
            return tree_->items_[index_];
        }

        // Next in-order node (larger key).
        node_type next() const {
            check();
            if (index_ == npos) return *this;
            return node_type(tree_, tree_->next_slot(index_));
        }

        // Previous in-order node (smaller key).
        node_type previous() const {
            check();
            if (index_ == npos) return *this;
            return node_type(tree_, tree_->previous_slot(index_));
        }

        index_type slot() const noexcept { return index_; }

    private:
        const RBSlotTree* tree_;
        index_type index_;
        version_type version_;

        node_type(const RBSlotTree* t, index_type i) noexcept : tree_(t), index_(i), version_(t->version_) {}

        void check() const {
            if (tree_ != nullptr && version_ != tree_->version_) throw stale_handle_error();
        }
    };

    // Restartable reverse-order view: for (auto& v : tree.reversed()) ...
    class reverse_view {
    public:
        explicit reverse_view(const RBSlotTree& t) noexcept : tree_(&t) {}
        const_reverse_iterator begin() const { return tree_->rbegin(); }
        const_reverse_iterator end() const { return tree_->rend(); }
        size_type size() const noexcept { return tree_->size(); }
    private:
        const RBSlotTree* tree_;
    };

    // constructors / destructor / assignment
    explicit RBSlotTree(const key_compare& comp = key_compare())
        : RBSlotTree(0, comp) {}

    explicit RBSlotTree(size_type capacity, const key_compare& comp = key_compare())
        : comp_(comp), root_(npos), free_list_(npos), last_index_(0), size_(0), version_(0), rotation_count_(0)
    {
        SlotArena::check_capacity(capacity, "RBSlotTree");
        items_.resize(capacity);
        slots_.resize(capacity, blank_slot());
    }

    // Sorts and de-duplicates the input, then links it as a balanced tree in one pass.
    template <typename InputIt>
    RBSlotTree(InputIt first, InputIt last, const key_compare& comp = key_compare())
        : RBSlotTree(comp)
    {
        assign_sorted_unique(std::vector<T>(first, last));
    }

    RBSlotTree(std::initializer_list<T> init, const key_compare& comp = key_compare())
        : RBSlotTree(init.begin(), init.end(), comp) {}

    RBSlotTree(const RBSlotTree& other)
        : items_(other.items_), slots_(other.slots_), comp_(other.comp_), root_(other.root_),
          free_list_(other.free_list_), last_index_(other.last_index_), size_(other.size_),
          version_(0), rotation_count_(0) {}

    RBSlotTree(RBSlotTree&& other) noexcept
        : items_(std::move(other.items_)), slots_(std::move(other.slots_)), comp_(std::move(other.comp_)),
          root_(other.root_), free_list_(other.free_list_), last_index_(other.last_index_), size_(other.size_),
          version_(0), rotation_count_(other.rotation_count_)
    {
        other.reset_after_move();
    }

    RBSlotTree& operator=(const RBSlotTree& other) {
        if (this != &other) {
            RBSlotTree tmp(other);
            swap(tmp);
        }
        return *this;
    }

    RBSlotTree& operator=(RBSlotTree&& other) noexcept {
        if (this == &other) return *this;
        items_ = std::move(other.items_);
        slots_ = std::move(other.slots_);
        comp_ = std::move(other.comp_);
        root_ = other.root_;
        free_list_ = other.free_list_;
        last_index_ = other.last_index_;
        size_ = other.size_;
        rotation_count_ = other.rotation_count_;
        ++version_;
        other.reset_after_move();
        return *this;
    }

    ~RBSlotTree() = default;

    void swap(RBSlotTree& other) noexcept {
        using std::swap;
        swap(items_, other.items_);
        swap(slots_, other.slots_);
        swap(comp_, other.comp_);
        swap(root_, other.root_);
        swap(free_list_, other.free_list_);
        swap(last_index_, other.last_index_);
        swap(size_, other.size_);
        swap(rotation_count_, other.rotation_count_);
        ++version_;
        ++other.version_;
    }

    // capacity
    bool empty() const noexcept { return size_ == 0; }
    size_type size() const noexcept { return size_; }
    size_type capacity() const noexcept { return slots_.size(); }
    size_type max_size() const noexcept { return SlotArena::max_slots; }
    version_type version() const noexcept { return version_; }

    // Grows the arena so that at least new_capacity slots exist.
    void reserve(size_type new_capacity) {
        SlotArena::check_capacity(new_capacity, "RBSlotTree::reserve");
        if (new_capacity > slots_.size()) grow(new_capacity);
    }

    // Reallocates the arena to exactly size() slots, packing live elements in order.
    void trim_excess() {
        std::vector<T> packed(size_);
        std::vector<Slot> slots(size_, blank_slot());
        index_type k = 0;
        for (index_type i = first_slot(); i != npos; i = next_slot(i)) packed[k++] = std::move(items_[i]);
        items_.swap(packed);
        slots_.swap(slots);
        relink_packed();
    }

    // iterators
    const_iterator begin() const noexcept { return const_iterator(this, first_slot()); }
    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator end() const noexcept { return const_iterator(this, npos); }
    const_iterator cend() const noexcept { return end(); }

    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator(end()); }
    const_reverse_iterator crbegin() const noexcept { return rbegin(); }
    const_reverse_iterator rend() const noexcept { return const_reverse_iterator(begin()); }
    const_reverse_iterator crend() const noexcept { return rend(); }

    reverse_view reversed() const noexcept { return reverse_view(*this); }

    // modifiers
    bool insert(const value_type& item) { return insert_impl(item); }
    bool insert(value_type&& item) { return insert_impl(std::move(item)); }

    template <typename... Args>
    bool emplace(Args&&... args) {
        value_type val(std::forward<Args>(args)...);
        return insert_impl(std::move(val));
    }

    bool erase(const value_type& item) {
        if (root_ == npos) return false;

        // Rotations below may change the shape even when item is absent.
        ++version_;

        index_type current = root_;
        index_type parent = npos;
        index_type grand_parent = npos;
        index_type match = npos;
        index_type parent_of_match = npos;
        bool found_match = false;

        while (current != npos) {
            if (is_2node(current)) {
                if (parent == npos) {
                    slots_[current].color = RED;
                } else {
                    index_type sibling = get_sibling(current, parent);
                    if (is_red(sibling)) {
                        // parent is a 3-node: flip the orientation of its red link
                        assert(!is_red(parent));
                        if (slots_[parent].right == sibling) rotate_left(parent);
                        else rotate_right(parent);

                        slots_[parent].color = RED;
                        slots_[sibling].color = BLACK;
                        replace_child_of_node_or_root(grand_parent, parent, sibling);
                        grand_parent = sibling;
                        if (parent == match) parent_of_match = sibling;

                        sibling = (slots_[parent].left == current) ? slots_[parent].right : slots_[parent].left;
                    }
                    assert(sibling != npos && !is_red(sibling));

                    if (is_2node(sibling)) {
                        merge_2nodes(parent, current, sibling);
                    } else {
                        // sibling is a 3-node or 4-node: borrow a red link from it
                        TreeRotation rotation = rotation_needed(parent, current, sibling);
                        index_type new_grand_parent = npos;
                        switch (rotation) {
                            case TreeRotation::Right:
                                assert(slots_[parent].left == sibling);
                                slots_[slots_[sibling].left].color = BLACK;
                                new_grand_parent = rotate_right(parent);
                                break;
                            case TreeRotation::Left:
                                assert(slots_[parent].right == sibling);
                                slots_[slots_[sibling].right].color = BLACK;
                                new_grand_parent = rotate_left(parent);
                                break;
                            case TreeRotation::RightLeft:
                                assert(slots_[parent].right == sibling);
                                new_grand_parent = rotate_right_left(parent);
                                break;
                            case TreeRotation::LeftRight:
                                assert(slots_[parent].left == sibling);
                                new_grand_parent = rotate_left_right(parent);
                                break;
                        }

                        slots_[new_grand_parent].color = slots_[parent].color;
                        slots_[parent].color = BLACK;
                        slots_[current].color = RED;
                        replace_child_of_node_or_root(grand_parent, parent, new_grand_parent);
                        if (parent == match) parent_of_match = new_grand_parent;
                        grand_parent = new_grand_parent;
                    }
                }
            }

            // after the match only the successor is wanted: keep going left
            int order = found_match ? -1 : compare(item, items_[current]);
            if (order == 0) {
                found_match = true;
                match = current;
                parent_of_match = parent;
            }

            grand_parent = parent;
            parent = current;
            current = (order < 0) ? slots_[current].left : slots_[current].right;
        }

        if (match != npos) {
            replace_node(match, parent_of_match, parent, grand_parent);
            --size_;
            return_slot(match);
        }

        if (root_ != npos) slots_[root_].color = BLACK;
        return found_match;
    }

    // Releases every element but keeps the arena for reuse.
    void clear() {
        for (size_type i = 0; i < last_index_; ++i) {
            items_[i] = value_type();
            slots_[i] = blank_slot();
        }
        root_ = npos;
        free_list_ = npos;
        last_index_ = 0;
        size_ = 0;
        ++version_;
    }

    // lookup
    bool contains(const value_type& item) const { return find_slot(item) != npos; }
    size_type count(const value_type& item) const { return contains(item) ? 1 : 0; }
    node_type find(const value_type& item) const { return node_type(this, find_slot(item)); }

    const value_type& min() const {
        if (root_ == npos) throw std::out_of_range("RBSlotTree::min: tree is empty");
        return items_[first_slot()];
    }

    const value_type& max() const {
        if (root_ == npos) throw std::out_of_range("RBSlotTree::max: tree is empty");
        return items_[last_slot()];
    }

    node_type first_node() const { return node_type(this, first_slot()); }
    node_type last_node() const { return node_type(this, last_slot()); }

    // Smallest element strictly greater than item; item need not be present.
    node_type find_next(const value_type& item) const {
        index_type current = root_;
        while (current != npos) {
            int order = compare(item, items_[current]);
            if (order == 0) return node_type(this, next_slot(current));
            if (order > 0) {
                if (slots_[current].right == npos) return node_type(this, next_slot(current));
                current = slots_[current].right;
            } else {
                if (slots_[current].left == npos) return node_type(this, current);
                current = slots_[current].left;
            }
        }
        return node_type(this, npos);
    }

    // Largest element strictly smaller than item; item need not be present.
    node_type find_previous(const value_type& item) const {
        index_type current = root_;
        while (current != npos) {
            int order = compare(item, items_[current]);
            if (order == 0) return node_type(this, previous_slot(current));
            if (order > 0) {
                if (slots_[current].right == npos) return node_type(this, current);
                current = slots_[current].right;
            } else {
                if (slots_[current].left == npos) return node_type(this, previous_slot(current));
                current = slots_[current].left;
            }
        }
        return node_type(this, npos);
    }

    const_iterator lower_bound(const value_type& item) const {
        index_type x = root_;
        index_type res = npos;
        while (x != npos) {
            if (!comp_(items_[x], item)) {
                res = x;
                x = slots_[x].left;
            } else x = slots_[x].right;
        }
        return const_iterator(this, res);
    }

    const_iterator upper_bound(const value_type& item) const {
        index_type x = root_;
        index_type res = npos;
        while (x != npos) {
            if (comp_(item, items_[x])) {
                res = x;
                x = slots_[x].left;
            } else x = slots_[x].right;
        }
        return const_iterator(this, res);
    }

    key_compare key_comp() const { return comp_; }

    // Instrumentation accessors
    size_t rotation_count() const noexcept { return rotation_count_; }
    void reset_rotation_count() noexcept { rotation_count_ = 0; }

    // validate_invariants_json:
    // Produces structured JSON diagnostics in out_json.
    // Returns true if invariants hold, false otherwise.
    //
    // JSON structure:
    // {
    //   "valid": true|false,
    //   "size_reported": n, "size_actual": n2, "free_slots": f, "last_index": l, "capacity": c,
    //   "black_height": bh, "rotation_count": r,
    //   "issues": [ "...", ... ],
    //   "nodes": [ { "slot": i, "key": "...", "color": "RED"|"BLACK", "parent": "..."|null, "left": ..., "right": ... }, ... ]
    // }
    bool validate_invariants_json(std::string& out_json) const {
        std::vector<std::string> issues;
        bool valid = true;
        int black_height = -1;

        if (items_.size() != slots_.size()) {
            issues.push_back("items and slots arrays differ in length");
            valid = false;
        }
        if (last_index_ > slots_.size()) {
            issues.push_back("last_index beyond capacity");
            valid = false;
        }

        auto in_range = [&](index_type i) { return i != npos && i < last_index_ && i < items_.size(); };

        if (root_ != npos) {
            if (!in_range(root_)) {
                issues.push_back("root index out of range");
                valid = false;
            } else {
                if (slots_[root_].color != BLACK) {
                    issues.push_back("root is not black");
                    valid = false;
                }
                if (slots_[root_].parent != npos) {
                    issues.push_back("root has a parent link");
                    valid = false;
                }
            }
        }

        // 0 = unvisited, 1 = live, 2 = free
        std::vector<unsigned char> state(last_index_ <= slots_.size() ? last_index_ : 0, 0);
        size_t counted = 0;

        std::function<std::pair<bool,int>(index_type, index_type, const T*, const T*)> validate_node;
        validate_node = [&](index_type node, index_type parent, const T* min_key, const T* max_key) -> std::pair<bool,int> {
            // Base: virtual leaf -> black-height 0
            if (node == npos) return { true, 0 };

            if (!in_range(node)) {
                issues.push_back("child link out of range: " + SlotArena::index_to_string(node));
                return { false, 0 };
            }
            if (state[node] != 0) {
                issues.push_back("slot reachable twice: " + SlotArena::index_to_string(node));
                return { false, 0 };
            }
            state[node] = 1;
            ++counted;

            const Slot& s = slots_[node];
            const T& key = items_[node];

            if (s.parent != parent) {
                std::ostringstream oss;
                oss << "Parent link mismatch for key " << SlotArena::to_display_string(key);
                issues.push_back(oss.str());
                return { false, 0 };
            }

            // BST order checks
            if (min_key && !comp_(*min_key, key)) {
                std::ostringstream oss;
                oss << "BST violation: node " << SlotArena::to_display_string(key)
                    << " <= min bound " << SlotArena::to_display_string(*min_key);
                issues.push_back(oss.str());
                return { false, 0 };
            }
            if (max_key && !comp_(key, *max_key)) {
                std::ostringstream oss;
                oss << "BST violation: node " << SlotArena::to_display_string(key)
                    << " >= max bound " << SlotArena::to_display_string(*max_key);
                issues.push_back(oss.str());
                return { false, 0 };
            }

            // red property
            if (s.color == RED) {
                if (is_red(s.left) || is_red(s.right)) {
                    std::ostringstream oss;
                    oss << "Red violation: node " << SlotArena::to_display_string(key) << " has a red child";
                    issues.push_back(oss.str());
                    return { false, 0 };
                }
            }

            auto left = validate_node(s.left, node, min_key, &key);
            if (!left.first) return { false, 0 };
            auto right = validate_node(s.right, node, &key, max_key);
            if (!right.first) return { false, 0 };

            if (left.second != right.second) {
                std::ostringstream oss;
                oss << "Black-height mismatch at key " << SlotArena::to_display_string(key)
                    << " left_bh=" << left.second << " right_bh=" << right.second;
                issues.push_back(oss.str());
                return { false, 0 };
            }

            int add = (s.color == BLACK) ? 1 : 0;
            return { true, left.second + add };
        };

        if (valid) {
            if (root_ != npos) {
                auto p = validate_node(root_, npos, nullptr, nullptr);
                if (!p.first) valid = false;
                black_height = p.second;
            } else {
                black_height = 0;
            }
        }

        if (counted != size_) {
            std::ostringstream oss;
            oss << "Size mismatch: size_=" << size_ << " actual=" << counted;
            issues.push_back(oss.str());
            valid = false;
        }

        // free list must hold exactly the slots below last_index_ that are not live
        size_t free_slots = 0;
        if (valid) {
            for (index_type f = free_list_; f != npos; f = slots_[f].parent) {
                if (!in_range(f)) {
                    issues.push_back("free list link out of range: " + SlotArena::index_to_string(f));
                    valid = false;
                    break;
                }
                if (state[f] == 1) {
                    issues.push_back("slot is both live and free: " + SlotArena::index_to_string(f));
                    valid = false;
                    break;
                }
                if (state[f] == 2) {
                    issues.push_back("free list cycle at slot " + SlotArena::index_to_string(f));
                    valid = false;
                    break;
                }
                state[f] = 2;
                ++free_slots;
            }
            if (valid && free_slots + size_ != last_index_) {
                std::ostringstream oss;
                oss << "Slot accounting mismatch: live=" << size_ << " free=" << free_slots
                    << " last_index=" << last_index_;
                issues.push_back(oss.str());
                valid = false;
            }
        }

        // Build node list (BFS for deterministic ordering)
        std::vector<std::string> node_jsons;
        if (valid && root_ != npos) {
            std::queue<index_type> q;
            q.push(root_);
            while (!q.empty()) {
                index_type n = q.front(); q.pop();
                const Slot& s = slots_[n];
                std::ostringstream nj;
                nj << "{";
                nj << "\"slot\":" << n << ",";
                nj << "\"key\":" << SlotArena::json_escape_and_quote(SlotArena::to_display_string(items_[n])) << ",";
                nj << "\"color\":\"" << (s.color == RED ? "RED" : "BLACK") << "\",";
                nj << "\"parent\":" << slot_key_json(s.parent) << ",";
                nj << "\"left\":" << slot_key_json(s.left) << ",";
                nj << "\"right\":" << slot_key_json(s.right);
                nj << "}";
                node_jsons.push_back(nj.str());
                if (s.left != npos) q.push(s.left);
                if (s.right != npos) q.push(s.right);
            }
        }

        // Compose final JSON
        std::ostringstream out;
        out << "{";
        out << "\"valid\":" << (valid ? "true" : "false") << ",";
        out << "\"size_reported\":" << size_ << ",";
        out << "\"size_actual\":" << counted << ",";
        out << "\"free_slots\":" << free_slots << ",";
        out << "\"last_index\":" << last_index_ << ",";
        out << "\"capacity\":" << slots_.size() << ",";
        out << "\"black_height\":" << black_height << ",";
        out << "\"rotation_count\":" << rotation_count_ << ",";
        out << "\"issues\":[";
        for (size_t i = 0; i < issues.size(); ++i) {
            out << SlotArena::json_escape_and_quote(issues[i]);
            if (i + 1 < issues.size()) out << ",";
        }
        out << "],";
        out << "\"nodes\":[";
        for (size_t i = 0; i < node_jsons.size(); ++i) {
            out << node_jsons[i];
            if (i + 1 < node_jsons.size()) out << ",";
        }
        out << "]";
        out << "}";
        out_json = out.str();
        return valid && issues.empty();
    }

    // Human-readable diagnostics: validity flag, JSON and a tree dump.
    bool validate_invariants(std::string* out = nullptr) const {
        std::string json;
        bool ok = validate_invariants_json(json);
        if (!out) return ok;
        std::ostringstream oss;
        oss << "validate_invariants: valid=" << (ok ? "true" : "false") << "\n";
        oss << "JSON diagnostics:\n" << json << "\n";
        if (ok) {
            oss << "Tree dump:\n" << tree_dump_to_string(true) << "\n";
        }
        *out = oss.str();
        return ok;
    }

    // Pretty-print tree with indentation. Set show_slots = true to include slot indices.
    void tree_dump(std::ostream& os, bool show_slots = false) const {
        os << tree_dump_to_string(show_slots);
    }

    std::string tree_dump_to_string(bool show_slots = false) const {
        std::ostringstream oss;
        if (root_ == npos) {
            oss << "<empty tree>\n";
            return oss.str();
        }
        std::function<void(index_type, std::string)> print_node = [&](index_type n, std::string indent) {
            if (n == npos) {
                oss << indent << "(NIL)\n";
                return;
            }
            const Slot& s = slots_[n];
            oss << indent << (s.color == RED ? "R " : "B ");
            oss << SlotArena::to_display_string(items_[n]);
            if (show_slots) oss << " #" << n;
            oss << "  parent=";
            if (s.parent != npos) oss << SlotArena::to_display_string(items_[s.parent]);
            else oss << "null";
            oss << "\n";
            print_node(s.left, indent + "  L-");
            print_node(s.right, indent + "  R-");
        };
        print_node(root_, "");
        return oss.str();
    }

private:
    std::vector<value_type> items_;
    std::vector<Slot> slots_;
    key_compare comp_;
    index_type root_;
    index_type free_list_;
    size_type last_index_;      // slots below this index have been handed out at least once
    size_type size_;
    version_type version_;
    size_t rotation_count_;

    int compare(const value_type& a, const value_type& b) const {
        if (comp_(a, b)) return -1;
        if (comp_(b, a)) return 1;
        return 0;
    }

    template <typename V>
    bool insert_impl(V&& item) {
        if (root_ == npos) {
            root_ = obtain_slot(std::forward<V>(item), BLACK);
            size_ = 1;
            ++version_;
            return true;
        }

        // Split 4-nodes along the search path so the leaf we reach is never a 4-node.
        // Splits and rotations change the shape even for a duplicate.
        ++version_;

        index_type current = root_;
        index_type parent = npos;
        index_type grand_parent = npos;
        index_type great_grand_parent = npos;

        int order = 0;
        while (current != npos) {
            order = compare(item, items_[current]);
            if (order == 0) {
                // a split may have reddened the root
                slots_[root_].color = BLACK;
                return false;
            }

            if (is_4node(current)) {
                split_4node(current);
                // two consecutive reds after the split
                if (is_red(parent)) insertion_balance(current, parent, grand_parent, great_grand_parent);
            }
            great_grand_parent = grand_parent;
            grand_parent = parent;
            parent = current;
            current = (order < 0) ? slots_[current].left : slots_[current].right;
        }

        assert(parent != npos);
        index_type node;
        try {
            node = obtain_slot(std::forward<V>(item), RED);
        } catch (...) {
            slots_[root_].color = BLACK;
            throw;
        }
        if (order > 0) set_right(parent, node);
        else set_left(parent, node);

        if (slots_[parent].color == RED) insertion_balance(node, parent, grand_parent, great_grand_parent);

        slots_[root_].color = BLACK;
        ++size_;
        return true;
    }

    // Fixes a red current under a red parent. parent is updated for the caller's next step;
    // grand_parent and great_grand_parent need not stay accurate because no split can follow immediately.
    void insertion_balance(index_type current, index_type& parent, index_type grand_parent, index_type great_grand_parent) {
        assert(grand_parent != npos);
        bool parent_is_on_right = (slots_[grand_parent].right == parent);
        bool current_is_on_right = (slots_[parent].right == current);

        index_type new_child_of_great_grand_parent;
        if (parent_is_on_right == current_is_on_right) {
            new_child_of_great_grand_parent = current_is_on_right ? rotate_left(grand_parent) : rotate_right(grand_parent);
        } else {
            new_child_of_great_grand_parent = current_is_on_right ? rotate_left_right(grand_parent) : rotate_right_left(grand_parent);
            // current now hangs directly under great_grand_parent
            parent = great_grand_parent;
        }
        slots_[grand_parent].color = RED;
        slots_[new_child_of_great_grand_parent].color = BLACK;

        replace_child_of_node_or_root(great_grand_parent, grand_parent, new_child_of_great_grand_parent);
    }

    // Splices successor into match's position. successor == match means match has no right subtree.
    void replace_node(index_type match, index_type parent_of_match, index_type successor, index_type parent_of_successor) {
        if (successor == match) {
            assert(slots_[match].right == npos);
            successor = slots_[match].left;
        } else {
            assert(parent_of_successor != npos);
            assert(slots_[successor].left == npos);
            assert((slots_[successor].right == npos && is_red(successor)) ||
                   (is_red(slots_[successor].right) && !is_red(successor)));
            if (slots_[successor].right != npos) slots_[slots_[successor].right].color = BLACK;

            if (parent_of_successor != match) {
                set_left(parent_of_successor, slots_[successor].right);
                set_right(successor, slots_[match].right);
            }
            set_left(successor, slots_[match].left);
        }

        if (successor != npos) slots_[successor].color = slots_[match].color;

        replace_child_of_node_or_root(parent_of_match, match, successor);
    }

    void replace_child_of_node_or_root(index_type parent, index_type child, index_type new_child) {
        if (parent != npos) {
            if (slots_[parent].left == child) set_left(parent, new_child);
            else set_right(parent, new_child);
        } else {
            root_ = new_child;
            if (root_ != npos) slots_[root_].parent = npos;
        }
    }

    // rotation helpers (these increment rotation_count_). The returned slot's own parent link
    // is fixed by replace_child_of_node_or_root.
    index_type rotate_left(index_type node) {
        index_type x = slots_[node].right;
        set_right(node, slots_[x].left);
        set_left(x, node);
        ++rotation_count_;
        return x;
    }

    index_type rotate_right(index_type node) {
        index_type x = slots_[node].left;
        set_left(node, slots_[x].right);
        set_right(x, node);
        ++rotation_count_;
        return x;
    }

    index_type rotate_left_right(index_type node) {
        index_type child = slots_[node].left;
        index_type grand_child = slots_[child].right;

        set_left(node, slots_[grand_child].right);
        set_right(grand_child, node);
        set_right(child, slots_[grand_child].left);
        set_left(grand_child, child);
        ++rotation_count_;
        return grand_child;
    }

    index_type rotate_right_left(index_type node) {
        index_type child = slots_[node].right;
        index_type grand_child = slots_[child].left;

        set_right(node, slots_[grand_child].left);
        set_left(grand_child, node);
        set_left(child, slots_[grand_child].right);
        set_right(grand_child, child);
        ++rotation_count_;
        return grand_child;
    }

    TreeRotation rotation_needed(index_type parent, index_type current, index_type sibling) const {
        assert(is_red(slots_[sibling].left) || is_red(slots_[sibling].right));
        if (is_red(slots_[sibling].left)) {
            return slots_[parent].left == current ? TreeRotation::RightLeft : TreeRotation::Right;
        }
        return slots_[parent].left == current ? TreeRotation::Left : TreeRotation::LeftRight;
    }

    void set_left(index_type node, index_type child) {
        slots_[node].left = child;
        if (child != npos) slots_[child].parent = node;
    }

    void set_right(index_type node, index_type child) {
        slots_[node].right = child;
        if (child != npos) slots_[child].parent = node;
    }

    index_type get_sibling(index_type node, index_type parent) const {
        return slots_[parent].left == node ? slots_[parent].right : slots_[parent].left;
    }

    bool is_red(index_type i) const { return i != npos && slots_[i].color == RED; }
    bool is_black(index_type i) const { return i != npos && slots_[i].color == BLACK; }
    bool is_null_or_black(index_type i) const { return i == npos || slots_[i].color == BLACK; }

    bool is_2node(index_type i) const {
        assert(i != npos);
        return is_black(i) && is_null_or_black(slots_[i].left) && is_null_or_black(slots_[i].right);
    }

    bool is_4node(index_type i) const { return is_red(slots_[i].left) && is_red(slots_[i].right); }

    void split_4node(index_type i) {
        slots_[i].color = RED;
        slots_[slots_[i].left].color = BLACK;
        slots_[slots_[i].right].color = BLACK;
    }

    // combine two 2-nodes into a 4-node
    void merge_2nodes(index_type parent, index_type child1, index_type child2) {
        assert(is_red(parent));
        slots_[parent].color = BLACK;
        slots_[child1].color = RED;
        slots_[child2].color = RED;
    }

    // slot allocation
    template <typename V>
    index_type obtain_slot(V&& item, Color color) {
        index_type index;
        if (free_list_ != npos) {
            index = free_list_;
            items_[index] = std::forward<V>(item);
            free_list_ = slots_[index].parent;
        } else {
            if (last_index_ == slots_.size()) grow(SlotArena::grown_capacity(slots_.size()));
            index = static_cast<index_type>(last_index_);
            items_[index] = std::forward<V>(item);
            ++last_index_;
        }
        slots_[index] = Slot{npos, npos, npos, color};
        return index;
    }

    void return_slot(index_type index) {
        items_[index] = value_type();
        slots_[index] = Slot{npos, npos, free_list_, BLACK};
        free_list_ = index;
    }

    void grow(size_type new_capacity) {
        slots_.reserve(new_capacity);
        items_.resize(new_capacity);
        slots_.resize(new_capacity, blank_slot());
    }

    void reset_after_move() noexcept {
        items_.clear();
        slots_.clear();
        root_ = npos;
        free_list_ = npos;
        last_index_ = 0;
        size_ = 0;
        rotation_count_ = 0;
        ++version_;
    }

    void assign_sorted_unique(std::vector<value_type> sorted) {
        std::sort(sorted.begin(), sorted.end(), comp_);
        sorted.erase(std::unique(sorted.begin(), sorted.end(),
                                 [this](const value_type& a, const value_type& b) { return !comp_(a, b); }),
                     sorted.end());
        SlotArena::check_capacity(sorted.size(), "RBSlotTree");
        std::vector<Slot> slots(sorted.size(), blank_slot());
        items_.swap(sorted);
        slots_.swap(slots);
        size_ = items_.size();
        relink_packed();
    }

    // items_[0, size_) hold the elements in sorted order and slots_ are blank: build the tree over them.
    void relink_packed() {
        last_index_ = size_;
        free_list_ = npos;
        root_ = link_sorted_range(0, static_cast<index_type>(size_), npos);
        if (root_ != npos) slots_[root_].parent = npos;
        ++version_;
    }

    // Links slots [first, first + count) into a red-black subtree and returns its root.
    // Odd counts split evenly around the middle; for even counts the element right of the middle
    // is set aside and hung red under the leftmost leaf of the right half, which keeps both halves
    // the same size and therefore the same black-height.
    index_type link_sorted_range(index_type first, index_type count, index_type red_node) {
        if (count == 0) return npos;

        index_type root;
        if (count == 1) {
            root = first;
            slots_[root].color = BLACK;
            if (red_node != npos) set_left(root, red_node);
        } else if (count == 2) {
            root = first;
            slots_[root].color = BLACK;
            slots_[first + 1].color = RED;
            set_right(root, first + 1);
            if (red_node != npos) set_left(root, red_node);
        } else if (count == 3) {
            root = first + 1;
            slots_[root].color = BLACK;
            slots_[first].color = BLACK;
            slots_[first + 2].color = BLACK;
            set_left(root, first);
            set_right(root, first + 2);
            if (red_node != npos) set_left(first, red_node);
        } else {
            index_type last = first + count - 1;
            index_type mid = first + (count - 1) / 2;
            root = mid;
            slots_[root].color = BLACK;
            set_left(root, link_sorted_range(first, mid - first, red_node));
            if (count % 2 == 0) {
                slots_[mid + 1].color = RED;
                set_right(root, link_sorted_range(mid + 2, last - mid - 1, mid + 1));
            } else {
                set_right(root, link_sorted_range(mid + 1, last - mid, npos));
            }
        }
        return root;
    }

    // utility accessors for iterators
    index_type first_slot() const {
        if (root_ == npos) return npos;
        index_type i = root_;
        while (slots_[i].left != npos) i = slots_[i].left;
        return i;
    }

    index_type last_slot() const {
        if (root_ == npos) return npos;
        index_type i = root_;
        while (slots_[i].right != npos) i = slots_[i].right;
        return i;
    }

    index_type next_slot(index_type i) const {
        if (i == npos) return npos;
        if (slots_[i].right != npos) {
            i = slots_[i].right;
            while (slots_[i].left != npos) i = slots_[i].left;
            return i;
        }
        while (slots_[i].parent != npos) {
            index_type p = slots_[i].parent;
            if (slots_[p].left == i) return p;
            i = p;
        }
        return npos;
    }

    index_type previous_slot(index_type i) const {
        if (i == npos) return npos;
        if (slots_[i].left != npos) {
            i = slots_[i].left;
            while (slots_[i].right != npos) i = slots_[i].right;
            return i;
        }
        while (slots_[i].parent != npos) {
            index_type p = slots_[i].parent;
            if (slots_[p].right == i) return p;
            i = p;
        }
        return npos;
    }

    index_type find_slot(const value_type& item) const {
        index_type x = root_;
        while (x != npos) {
            int order = compare(item, items_[x]);
            if (order == 0) return x;
            x = (order < 0) ? slots_[x].left : slots_[x].right;
        }
        return npos;
    }

    std::string slot_key_json(index_type i) const {
        if (i == npos) return "null";
        return SlotArena::json_escape_and_quote(SlotArena::to_display_string(items_[i]));
    }
};

#endif // RED_BLACK_SLOT_TREE_HPP
