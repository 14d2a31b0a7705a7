// -----------------------------
// Examples (compile-time guard)
// -----------------------------
// Define SLOT_COLLECTIONS_EXAMPLE_MAIN to compile and run examples for the slot collections.
//
// Example 1: OrderedDictionary keeps insertion order and can relink entries in O(1).
// Example 2: SortedSet neighbour queries and reverse enumeration.
// Example 3: a stale iterator throws after the collection changes.
// To build examples compile with: -DSLOT_COLLECTIONS_EXAMPLE_MAIN

#ifdef SLOT_COLLECTIONS_EXAMPLE_MAIN
#include <iostream>
#include <string>

#include "ordered_dictionary.hpp"
#include "ordered_hash_set.hpp"
#include "sorted_set.hpp"

int main() {
    {
        std::cout << "Example 1: ordered dictionary\n";
        OrderedDictionary<std::string, int> d;
        d.add("one", 1);
        d.add("two", 2);
        d.add("three", 3);
        d.move_first("three");
        d.move_after("one", "two");

        for (const auto& kv : d) std::cout << "  " << kv.first << " = " << kv.second << "\n";
        std::cout << "  reversed keys:";
        for (const auto& k : d.keys().reversed()) std::cout << " " << k;
        std::cout << "\n";
        d.order_dump(std::cout);

        OrderedHashSet<int> seen{5, 3, 5, 1};
        std::cout << "  set:";
        for (int v : seen) std::cout << " " << v;
        std::cout << "\n";
    }

    {
        std::cout << "\nExample 2: sorted set\n";
        SortedSet<int> s{1, 2, 3, 4, 6, 7, 8, 9, 10};
        std::cout << "  next after 4: " << s.find_next(4).value() << "\n";
        std::cout << "  previous before 6: " << s.find_previous(6).value() << "\n";
        std::cout << "  next after 5: " << s.find_next(5).value() << "\n";
        std::cout << "  descending:";
        for (int v : s.reversed()) std::cout << " " << v;
        std::cout << "\n";
        s.tree_dump(std::cout, true);
    }

    {
        std::cout << "\nExample 3: stale iterator\n";
        SortedSet<int> s{1, 2, 3};
        auto it = s.begin();
        s.add(4);
        try {
            std::cout << *it << "\n";
        } catch (const stale_handle_error& e) {
            std::cout << "  caught: " << e.what() << "\n";
        }
    }

    return 0;
}
#endif // SLOT_COLLECTIONS_EXAMPLE_MAIN
