// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value_compare.cpp - Structural comparison of value graphs

#include <graphser/function.h>
#include <graphser/value_compare.h>

#include <tsl/robin_map.h>

#include <vector>

namespace graphser {

namespace {

class GraphComparer {
public:
    bool equal(const Value& a, const Value& b) {
        if (a.data.index() != b.data.index())
            return false;
        if (!a.has_identity())
            return a == b;

        const void* ia = a.identity();
        const void* ib = b.identity();

        if (auto it = forward_.find(ia); it != forward_.end())
            return it->second == ib;
        if (backward_.count(ib))
            return false;

        forward_.emplace(ia, ib);
        backward_.emplace(ib, ia);

        if (const Function* fa = a.as_function())
            return fa->name() == b.as_function()->name();

        return equal_tables(*a.as_table(), *b.as_table());
    }

private:
    using Pairing = tsl::robin_map<const void*, const void*>;

    bool equal_tables(const Table& a, const Table& b) {
        if (a.type_name() != b.type_name() || a.entry_count() != b.entry_count())
            return false;

        bool same = true;
        a.for_each_entry([&](const Value& key, const Value& value) {
            if (!same) return;
            same = key.has_identity() ? equal_identity_key(key, value, b)
                                      : equal(value, b.get(key));
        });
        return same;
    }

    /// Keys with identity: the partner key is the already paired object, or
    /// one of b's unpaired identity keys that compares equal
    bool equal_identity_key(const Value& key, const Value& value, const Table& b) {
        if (auto it = forward_.find(key.identity()); it != forward_.end()) {
            for (const auto& [bk, bv] : b.fields()) {
                if (bk.identity() == it->second)
                    return equal(value, bv);
            }
            return false;
        }

        for (const auto& [bk, bv] : b.fields()) {
            if (!bk.has_identity() || backward_.count(bk.identity()))
                continue;

            const Pairing saved_forward = forward_;
            const Pairing saved_backward = backward_;
            if (equal(key, bk) && equal(value, bv))
                return true;
            forward_ = saved_forward;
            backward_ = saved_backward;
        }
        return false;
    }

    Pairing forward_;
    Pairing backward_;
};

} // anonymous namespace

bool deep_equal(const Value& a, const Value& b) {
    GraphComparer comparer;
    return comparer.equal(a, b);
}

} // namespace graphser
