#include <catch2/catch.hpp>
#include "tansaku_csp/domain.hpp"
#include "tansaku_csp/domain_store.hpp"
#include "tansaku_csp/assignment.hpp"

#include <vector>

using namespace tansaku_csp;

// ============================================================================
// Domain (Sparse Set) tests
// ============================================================================

TEST_CASE("Domain basic operations", "[domain]") {
    Domain d(1, 9);

    SECTION("initial state") {
        REQUIRE(d.size() == 9);
        REQUIRE(!d.empty());
        REQUIRE(!d.is_singleton());
        REQUIRE(d.capacity() == 9);
    }

    SECTION("contains") {
        REQUIRE(d.contains(1));
        REQUIRE(d.contains(9));
        REQUIRE(!d.contains(0));
        REQUIRE(!d.contains(10));
    }

    SECTION("values are ascending") {
        auto vals = d.values();
        REQUIRE(vals == std::vector<Domain::value_type>{1, 2, 3, 4, 5, 6, 7, 8, 9});
    }
}

TEST_CASE("Domain from explicit values", "[domain]") {
    Domain d(std::vector<Domain::value_type>{7, 3, 3, 5});

    REQUIRE(d.size() == 3);
    REQUIRE(d.contains(3));
    REQUIRE(d.contains(5));
    REQUIRE(d.contains(7));
    REQUIRE(!d.contains(4));
    REQUIRE(!d.contains(6));
    REQUIRE(d.values() == std::vector<Domain::value_type>{3, 5, 7});
}

TEST_CASE("Domain remove", "[domain]") {
    Domain d(1, 5);

    SECTION("remove present value") {
        REQUIRE(d.remove(3));
        REQUIRE(d.size() == 4);
        REQUIRE(!d.contains(3));
        REQUIRE(d.values() == std::vector<Domain::value_type>{1, 2, 4, 5});
    }

    SECTION("remove absent value is a no-op") {
        REQUIRE(d.remove(3));
        REQUIRE(!d.remove(3));
        REQUIRE(!d.remove(42));
        REQUIRE(d.size() == 4);
    }

    SECTION("remove every value empties the domain") {
        for (Domain::value_type v = 1; v <= 5; ++v) {
            REQUIRE(d.remove(v));
        }
        REQUIRE(d.empty());
        REQUIRE(d.values().empty());
    }
}

TEST_CASE("Domain restore", "[domain]") {
    Domain d(1, 5);
    Domain original = d;

    SECTION("restore brings a removed value back") {
        d.remove(2);
        d.remove(4);
        REQUIRE(d.restore(4));
        REQUIRE(d.restore(2));
        REQUIRE(d == original);
    }

    SECTION("restore of a present value is idempotent") {
        REQUIRE(!d.restore(3));
        REQUIRE(d.size() == 5);
        d.remove(3);
        REQUIRE(d.restore(3));
        REQUIRE(!d.restore(3));
        REQUIRE(d.size() == 5);
    }

    SECTION("values outside the initial set cannot be restored") {
        REQUIRE(!d.restore(0));
        REQUIRE(!d.restore(6));
        REQUIRE(d.size() == 5);
    }

    SECTION("restore order does not matter for equality") {
        d.remove(1);
        d.remove(5);
        d.remove(3);
        d.restore(1);
        d.restore(5);
        d.restore(3);
        REQUIRE(d == original);
        REQUIRE(d.values() == original.values());
    }
}

// ============================================================================
// DomainStore tests
// ============================================================================

TEST_CASE("DomainStore prune records only effective removals", "[domain_store]") {
    DomainStore store;
    store.add(Domain(1, 3));
    store.add(Domain(1, 3));

    PruningRecord record;
    REQUIRE(store.prune(0, 2, record));
    REQUIRE(!store.prune(0, 2, record));
    REQUIRE(!store.prune(1, 7, record));

    REQUIRE(record.size() == 1);
    REQUIRE(record[0] == Pruning{0, 2});
    REQUIRE(store.size(0) == 2);
    REQUIRE(store.size(1) == 3);
}

TEST_CASE("DomainStore collapse", "[domain_store]") {
    DomainStore store;
    store.add(Domain(1, 4));

    SECTION("collapse to a present value") {
        PruningRecord record;
        REQUIRE(store.collapse(0, 3, record));
        REQUIRE(store.domain(0).is_singleton());
        REQUIRE(store.domain(0).contains(3));
        REQUIRE(record.size() == 3);
        for (const auto& p : record) {
            REQUIRE(p.var_idx == 0);
            REQUIRE(p.value != 3);
        }
    }

    SECTION("collapse to an absent value fails without change") {
        PruningRecord record;
        REQUIRE(!store.collapse(0, 9, record));
        REQUIRE(record.empty());
        REQUIRE(store.size(0) == 4);
    }
}

TEST_CASE("DomainStore undo restores the exact prior state", "[domain_store]") {
    DomainStore store;
    store.add(Domain(1, 9));
    store.add(Domain(1, 9));
    store.add(Domain(std::vector<Domain::value_type>{2, 4, 6}));
    const DomainStore before = store;

    PruningRecord record;
    store.collapse(0, 5, record);
    store.prune(1, 5, record);
    store.prune(2, 4, record);
    store.prune(1, 1, record);
    store.prune(1, 5, record);  // already gone, not recorded
    REQUIRE(store != before);
    REQUIRE(record.size() == 8 + 1 + 1 + 1);

    store.undo(record);
    REQUIRE(store == before);

    // A second undo of the same record must not change anything further
    store.undo(record);
    REQUIRE(store == before);
}

TEST_CASE("DomainStore nested records undo in reverse", "[domain_store]") {
    DomainStore store;
    store.add(Domain(1, 3));
    store.add(Domain(1, 3));
    const DomainStore root = store;

    PruningRecord outer;
    store.collapse(0, 1, outer);
    store.prune(1, 1, outer);
    const DomainStore after_outer = store;

    PruningRecord inner;
    store.collapse(1, 2, inner);
    REQUIRE(store.domain(1).values() == std::vector<Domain::value_type>{2});

    store.undo(inner);
    REQUIRE(store == after_outer);
    store.undo(outer);
    REQUIRE(store == root);
}

// ============================================================================
// Assignment tests
// ============================================================================

TEST_CASE("Assignment tracks assigned variables", "[assignment]") {
    Assignment a(3);

    REQUIRE(a.assigned_count() == 0);
    REQUIRE(!a.is_complete());

    a.assign(0, 4);
    a.assign(0, 5);  // overwrite does not double count
    a.assign(2, 1);
    REQUIRE(a.assigned_count() == 2);
    REQUIRE(a.value(0) == 5);
    REQUIRE(!a.value(1).has_value());

    a.assign(1, 7);
    REQUIRE(a.is_complete());

    a.unassign(1);
    a.unassign(1);
    REQUIRE(a.assigned_count() == 2);
    REQUIRE(!a.is_assigned(1));
}
