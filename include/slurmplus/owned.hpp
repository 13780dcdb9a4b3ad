/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <string_view>

#include "slurmplus/foreign.hpp"
#include "slurmplus/text.hpp"

namespace slurmplus {

// Borrowed view over one Slurm struct. A view never frees what it points
// at; the memory belongs to whoever handed out the pointer (a containing
// message, a list, an Owned<> wrapper) and the view must not outlive it.
//
// Each wrapped type V derives from View<S> and may hide destroy() when S
// carries owned sub-pointers or has a dedicated Slurm destructor.
template <typename S>
class View {
public:
    using Raw = S;

    View() noexcept = default;
    explicit View(S* ptr) noexcept : ptr_(ptr) {}

    [[nodiscard]] S* raw() const noexcept { return ptr_; }
    [[nodiscard]] bool isNull() const noexcept { return ptr_ == nullptr; }

    // Teardown used by Owned<V> for structs with no owned sub-pointers.
    static void destroy(S* ptr) noexcept { foreign::release(ptr); }

protected:
    // Trusts the handle: callers establish that it is valid and non-null.
    [[nodiscard]] S& get() const noexcept { return *ptr_; }

private:
    S* ptr_ = nullptr;
};

// View of the struct a parent's pointer (a field, or an element of an array
// the parent owns) refers to. No allocation, no copy of the struct; valid
// only while the parent is alive.
template <typename V>
[[nodiscard]] V borrow(typename V::Raw* const& field) noexcept {
    return V(field);
}

// Sole owner of one Slurm-allocated struct, seen through view type V.
// Destruction runs V::destroy exactly once. Moving hands the obligation to
// the destination and leaves the source null; release() gives it up
// entirely, typically to a Slurm list that frees the element later.
template <typename V>
class Owned final {
public:
    using Raw = typename V::Raw;

    Owned() noexcept = default;

    [[nodiscard]] static Owned allocZeroed() {
        return Owned(foreign::allocateZeroed<Raw>());
    }

    // The caller asserts that nothing else will free ptr.
    [[nodiscard]] static Owned assume(Raw* ptr) noexcept {
        return Owned(ptr);
    }

    ~Owned() { reset(); }

    Owned(const Owned&) = delete;
    Owned& operator=(const Owned&) = delete;

    Owned(Owned&& other) noexcept : view_(other.view_) {
        other.view_ = V();
    }

    Owned& operator=(Owned&& other) noexcept {
        if (this != &other) {
            reset();
            view_ = other.view_;
            other.view_ = V();
        }
        return *this;
    }

    // Gives up ownership; destruction of *this becomes a no-op.
    [[nodiscard]] V release() noexcept {
        V view = view_;
        view_ = V();
        return view;
    }

    void reset() noexcept {
        if (!view_.isNull()) {
            V::destroy(view_.raw());
            view_ = V();
        }
    }

    [[nodiscard]] Raw* raw() const noexcept { return view_.raw(); }
    [[nodiscard]] explicit operator bool() const noexcept { return !view_.isNull(); }

    [[nodiscard]] const V& view() const noexcept { return view_; }
    V& operator*() noexcept { return view_; }
    const V& operator*() const noexcept { return view_; }
    V* operator->() noexcept { return &view_; }
    const V* operator->() const noexcept { return &view_; }

private:
    explicit Owned(Raw* ptr) noexcept : view_(ptr) {}

    V view_;
};

// String allocated by Slurm's allocator, e.g. an element of a Slurm list
// of names or uids.
class CString : public View<char> {
public:
    using View::View;

    [[nodiscard]] static Owned<CString> create(std::string_view text) {
        return Owned<CString>::assume(foreign::allocateString(text));
    }

    [[nodiscard]] std::string text() const { return lossyText(raw()); }
};

}
