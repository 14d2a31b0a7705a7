// slot_arena.hpp
// Shared plumbing for the slot-array collections (RBSlotTree, OrderedHashTable and the adapters built on them).
//
// - C++17 header-only.
// - SlotArena::index_type / SlotArena::npos: integer handles into a container's flat arrays. npos means "no slot".
// - Growth policy: tree arenas double with a small floor; hashed arenas grow to a prime of at least twice the count.
// - Version stamps: every container keeps a counter that is bumped on each structural change. Iterators and
//   node handles capture it and throw stale_handle_error when it no longer matches.
// - Diagnostics helpers (JSON quoting, streaming a key to a string) used by validate_invariants_json and the dumps.

#ifndef SLOT_ARENA_HPP
#define SLOT_ARENA_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

// Thrown by an iterator or node handle used after its container was structurally modified.
class stale_handle_error : public std::logic_error {
public:
    stale_handle_error()
        : std::logic_error("collection was modified; enumeration operation may not execute") {}
    explicit stale_handle_error(const std::string& what) : std::logic_error(what) {}
};

// Thrown by add-style inserts when an equal key is already present.
class duplicate_key_error : public std::invalid_argument {
public:
    explicit duplicate_key_error(const std::string& what) : std::invalid_argument(what) {}
};

// Placeholder mapped type for set-like containers built on a key/value engine.
struct SlotArenaUnit {
    bool operator==(const SlotArenaUnit&) const noexcept { return true; }
    bool operator!=(const SlotArenaUnit&) const noexcept { return false; }
};

inline std::ostream& operator<<(std::ostream& os, const SlotArenaUnit&) { return os << "-"; }

struct SlotArena {
    using index_type   = std::uint32_t;
    using version_type = std::uint64_t;

    static constexpr index_type npos = std::numeric_limits<index_type>::max();

    // Smallest non-zero tree arena.
    static constexpr std::size_t min_capacity = 4;

    // Largest slot count an arena can address (npos is reserved).
    static constexpr std::size_t max_slots = static_cast<std::size_t>(npos) - 1;

    // Throws std::length_error when a requested capacity cannot be addressed by index_type.
    static void check_capacity(std::size_t requested, const char* who) {
        if (requested > max_slots) {
            throw std::length_error(std::string(who) + ": requested capacity exceeds max_size()");
        }
    }

    // Next capacity for a full doubling arena.
    static std::size_t grown_capacity(std::size_t current) {
        std::size_t next = current < min_capacity ? min_capacity : current * 2;
        if (next > max_slots) next = max_slots;
        if (next <= current) throw std::length_error("SlotArena: arena is full");
        return next;
    }

    // Smallest prime >= min_size. Table entries are ~20% apart so a request lands close to its target.
    static std::size_t prime_at_least(std::size_t min_size) {
        static const std::size_t primes[] = {
                   3,         7,        11,        17,        23,        29,        37,        47,
                  59,        71,        89,       107,       131,       163,       197,       239,
                 293,       353,       431,       521,       631,       761,       919,      1103,
                1327,      1597,      1931,      2333,      2801,      3371,      4049,      4861,
                5839,      7013,      8419,     10103,     12143,     14591,     17519,     21023,
               25229,     30293,     36353,     43627,     52361,     62851,     75431,     90523,
              108631,    130363,    156437,    187751,    225307,    270371,    324449,    389357,
              467237,    560689,    672827,    807403,    968897,   1162687,   1395263,   1674319,
             2009191,   2411033,   2893249,   3471899,   4166287,   4999559,   5999471,   7199369
        };
        for (std::size_t p : primes) {
            if (p >= min_size) return p;
        }
        for (std::size_t candidate = min_size | 1; candidate < max_slots; candidate += 2) {
            if (is_prime(candidate)) return candidate;
        }
        return min_size;
    }

    // Prime capacity for a full hashed arena holding old_size entries.
    static std::size_t expand_prime(std::size_t old_size) {
        std::size_t new_size = 2 * old_size;
        if (new_size > max_slots || new_size < old_size) {
            if (old_size >= max_slots) throw std::length_error("SlotArena: arena is full");
            return max_slots;
        }
        return prime_at_least(new_size);
    }

    static bool is_prime(std::size_t candidate) {
        if ((candidate & 1) == 0) return candidate == 2;
        for (std::size_t divisor = 3; divisor * divisor <= candidate; divisor += 2) {
            if (candidate % divisor == 0) return false;
        }
        return candidate > 1;
    }

    // escape string for JSON and wrap in quotes
    static std::string json_escape_and_quote(const std::string& s) {
        std::ostringstream o;
        o << "\"";
        for (char c : s) {
            switch (c) {
                case '\"': o << "\\\""; break;
                case '\\': o << "\\\\"; break;
                case '\b': o << "\\b"; break;
                case '\f': o << "\\f"; break;
                case '\n': o << "\\n"; break;
                case '\r': o << "\\r"; break;
                case '\t': o << "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        o << "\\u" << std::hex << (int)c << std::dec;
                    } else {
                        o << c;
                    }
            }
        }
        o << "\"";
        return o.str();
    }

    // stream a value into a string (requires operator<<)
    template <typename V>
    static std::string to_display_string(const V& v) {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }

    static std::string index_to_string(index_type i) {
        return i == npos ? std::string("null") : std::to_string(i);
    }
};

#endif // SLOT_ARENA_HPP
