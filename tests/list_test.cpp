/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

// Tests for typed views and cursors over Slurm lists

#include "slurmplus/list.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace slurmplus;

namespace {
int g_destroyed = 0;
}

struct Probe {
    int value;
};

class ProbeView : public View<Probe> {
public:
    using View::View;

    static void destroy(Probe* probe) noexcept {
        ++g_destroyed;
        foreign::release(probe);
    }

    int value() const noexcept { return get().value; }
    void setValue(int v) noexcept { get().value = v; }
};

// Parent struct with a lazily created list field, as in slurmdb_job_cond_t.
struct Holder {
    SlurmListHandle probes;
};

Owned<ProbeView> makeProbe(int value) {
    auto probe = Owned<ProbeView>::allocZeroed();
    probe->setValue(value);
    return probe;
}

void test_null_list_is_empty() {
    std::cout << "Testing iteration over a null list..." << std::endl;

    Holder holder{nullptr};
    auto list = ForeignList<ProbeView>::borrow(holder.probes);
    assert(list.isNull());
    assert(list.size() == 0);
    assert(list.empty());

    auto it = list.iter();
    assert(!it.next());
    assert(!it.next());

    OwnedList<ProbeView> none;
    assert(none.empty());
    int seen = 0;
    for (const ProbeView& probe : none.iter()) {
        (void)probe;
        ++seen;
    }
    assert(seen == 0);

    std::cout << "✓ A null list yields no elements" << std::endl;
}

void test_empty_list_matches_null() {
    std::cout << "Testing iteration over an allocated empty list..." << std::endl;

    g_destroyed = 0;
    {
        auto list = OwnedList<ProbeView>::assume(slurm_list_create(&destroyElement<ProbeView>));
        assert(!list.view().isNull());
        assert(list.size() == 0);
        auto it = list.iter();
        assert(!it.next());
    }
    assert(g_destroyed == 0);

    std::cout << "✓ An empty list reads the same as a null one" << std::endl;
}

void test_append_creates_list_lazily() {
    std::cout << "Testing lazy creation on append..." << std::endl;

    g_destroyed = 0;
    Holder holder{nullptr};
    {
        auto list = ForeignList<ProbeView>::borrow(holder.probes);
        list.append(makeProbe(1));
        assert(!list.isNull());
        assert(list.size() == 1);
    }
    // The parent sees the list created through the view.
    assert(holder.probes != nullptr);

    auto owned = OwnedList<ProbeView>::assume(holder.probes);
    holder.probes = nullptr;
    owned.reset();
    assert(g_destroyed == 1);

    std::cout << "✓ append() creates the list in the parent's field" << std::endl;
}

void test_round_trip_and_exhaustion() {
    std::cout << "Testing element order and exhaustion..." << std::endl;

    g_destroyed = 0;
    {
        OwnedList<ProbeView> list;
        auto view = list.view();
        for (int i = 0; i < 4; ++i) {
            view.append(makeProbe(i * 10));
        }
        assert(list.size() == 4);

        auto it = list.iter();
        for (int i = 0; i < 4; ++i) {
            auto probe = it.next();
            assert(probe);
            assert(probe->value() == i * 10);
        }
        assert(!it.next());
        assert(!it.next());
        assert(!it.next());

        std::vector<int> values;
        for (const ProbeView& probe : list.iter()) {
            values.push_back(probe.value());
        }
        assert((values == std::vector<int>{0, 10, 20, 30}));

        // Cursors never free elements.
        assert(g_destroyed == 0);
    }
    assert(g_destroyed == 4);

    std::cout << "✓ Elements come back in order, then next() stays empty" << std::endl;
}

void test_views_alias_list_elements() {
    std::cout << "Testing that yielded views alias the stored elements..." << std::endl;

    g_destroyed = 0;
    {
        OwnedList<ProbeView> list;
        list.view().append(makeProbe(5));

        auto first = list.iter().next();
        assert(first);
        first->setValue(6);

        auto again = list.iter().next();
        assert(again->raw() == first->raw());
        assert(again->value() == 6);
    }
    assert(g_destroyed == 1);

    std::cout << "✓ Views point into the list rather than at copies" << std::endl;
}

void test_moved_list_owns_once() {
    std::cout << "Testing moves of an owned list..." << std::endl;

    g_destroyed = 0;
    {
        OwnedList<ProbeView> first;
        first.view().append(makeProbe(1));
        first.view().append(makeProbe(2));

        OwnedList<ProbeView> second(std::move(first));
        assert(first.empty());
        assert(second.size() == 2);

        OwnedList<ProbeView> third;
        third.view().append(makeProbe(3));
        third = std::move(second);
        assert(g_destroyed == 1);
        assert(third.size() == 2);
    }
    assert(g_destroyed == 3);

    std::cout << "✓ Moving hands the list over without double frees" << std::endl;
}

void test_string_list() {
    std::cout << "Testing lists of Slurm strings..." << std::endl;

    Holder holder{nullptr};
    auto names = ForeignList<CString>::borrow(holder.probes);
    names.append(CString::create("1000"));
    names.append(CString::create("1001"));

    std::vector<std::string> seen;
    for (const CString& name : names.iter()) {
        seen.push_back(name.text());
    }
    assert((seen == std::vector<std::string>{"1000", "1001"}));

    OwnedList<CString>::assume(holder.probes).reset();
    holder.probes = nullptr;

    std::cout << "✓ String elements round-trip through a list" << std::endl;
}

int main() {
    std::cout << "\n=== Foreign List Test Suite ===" << std::endl;

    test_null_list_is_empty();
    test_empty_list_matches_null();
    test_append_creates_list_lazily();
    test_round_trip_and_exhaustion();
    test_views_alias_list_elements();
    test_moved_list_owns_once();
    test_string_list();

    std::cout << "\n✅ All foreign list tests passed!" << std::endl;
    return 0;
}
