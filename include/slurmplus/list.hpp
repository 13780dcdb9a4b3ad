/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <iterator>
#include <optional>

#include "slurmplus/foreign.hpp"
#include "slurmplus/owned.hpp"

#include <slurm/slurm.h>

// Slurm spells these List/ListIterator in older releases and list_t /
// list_itr_t in newer ones; the underlying structs are the same.
using SlurmListHandle = struct xlist*;
using SlurmListCursor = struct listIterator*;

namespace slurmplus {

// Destructor Slurm calls on each element when the list is destroyed.
template <typename T>
void destroyElement(void* element) {
    T::destroy(static_cast<typename T::Raw*>(element));
}

template <typename T>
class ListIterator;

// Typed view over a Slurm list whose elements are all T::Raw*. The element
// type is a convention established where the list is filled; Slurm does not
// check it.
//
// The view refers to the slot that holds the list pointer (usually a field
// of a parent struct) so a list created lazily by append() is seen by the
// parent. A null slot and an empty list read the same: no elements.
template <typename T>
class ForeignList {
public:
    explicit ForeignList(SlurmListHandle* slot) noexcept : slot_(slot) {}

    // View of a list-pointer field inside a parent struct.
    [[nodiscard]] static ForeignList borrow(SlurmListHandle& field) noexcept {
        return ForeignList(&field);
    }

    [[nodiscard]] SlurmListHandle raw() const noexcept { return *slot_; }
    [[nodiscard]] bool isNull() const noexcept { return *slot_ == nullptr; }

    // The list takes over the element; it is freed with T::destroy when the
    // list is destroyed.
    void append(Owned<T> item) {
        if (!*slot_) {
            *slot_ = slurm_list_create(&destroyElement<T>);
            if (!*slot_) {
                foreign::fatal("slurm_list_create failed");
            }
        }
        T view = item.release();
        slurm_list_append(*slot_, view.raw());
    }

    [[nodiscard]] std::size_t size() const noexcept {
        if (!*slot_) {
            return 0;
        }
        return static_cast<std::size_t>(slurm_list_count(*slot_));
    }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    [[nodiscard]] ListIterator<T> iter() const { return ListIterator<T>(*slot_); }

private:
    SlurmListHandle* slot_;
};

// Owned cursor over a ForeignList. Yields views lazily, front to back, once;
// after the end every next() returns nullopt. Destroying the iterator frees
// the cursor only, never the list or its elements.
template <typename T>
class ListIterator {
public:
    explicit ListIterator(SlurmListHandle list) {
        if (!list) {
            return;
        }
        cursor_ = slurm_list_iterator_create(list);
        if (!cursor_) {
            foreign::fatal("slurm_list_iterator_create failed");
        }
    }

    ~ListIterator() {
        if (cursor_) {
            slurm_list_iterator_destroy(cursor_);
        }
    }

    ListIterator(const ListIterator&) = delete;
    ListIterator& operator=(const ListIterator&) = delete;

    ListIterator(ListIterator&& other) noexcept
        : cursor_(other.cursor_), done_(other.done_) {
        other.cursor_ = nullptr;
        other.done_ = true;
    }

    ListIterator& operator=(ListIterator&&) = delete;

    [[nodiscard]] std::optional<T> next() {
        if (done_ || !cursor_) {
            done_ = true;
            return std::nullopt;
        }
        void* element = slurm_list_next(cursor_);
        if (!element) {
            done_ = true;
            return std::nullopt;
        }
        return T(static_cast<typename T::Raw*>(element));
    }

    // Single-pass input iteration so the cursor works in range-for.
    class Position {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        Position() noexcept = default;
        explicit Position(ListIterator* owner) : owner_(owner) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        Position& operator++() {
            advance();
            return *this;
        }
        Position operator++(int) {
            Position before = *this;
            advance();
            return before;
        }

        bool operator==(const Position& other) const noexcept {
            return !current_ && !other.current_;
        }
        bool operator!=(const Position& other) const noexcept { return !(*this == other); }

    private:
        void advance() { current_ = owner_ ? owner_->next() : std::nullopt; }

        ListIterator* owner_ = nullptr;
        std::optional<T> current_;
    };

    [[nodiscard]] Position begin() { return Position(this); }
    [[nodiscard]] Position end() noexcept { return Position(); }

private:
    SlurmListCursor cursor_ = nullptr;
    bool done_ = false;
};

// Owns a whole Slurm list, e.g. the result of an accounting query. The list
// is destroyed with slurm_list_destroy, which runs the element destructor
// registered when the list was created.
template <typename T>
class OwnedList final {
public:
    OwnedList() noexcept = default;

    [[nodiscard]] static OwnedList assume(SlurmListHandle list) noexcept {
        OwnedList owned;
        owned.handle_ = list;
        return owned;
    }

    ~OwnedList() { reset(); }

    OwnedList(const OwnedList&) = delete;
    OwnedList& operator=(const OwnedList&) = delete;

    OwnedList(OwnedList&& other) noexcept : handle_(other.handle_) {
        other.handle_ = nullptr;
    }

    OwnedList& operator=(OwnedList&& other) noexcept {
        if (this != &other) {
            reset();
            handle_ = other.handle_;
            other.handle_ = nullptr;
        }
        return *this;
    }

    void reset() noexcept {
        if (handle_) {
            slurm_list_destroy(handle_);
            handle_ = nullptr;
        }
    }

    // Borrowed; do not keep it past a move of this OwnedList.
    [[nodiscard]] ForeignList<T> view() noexcept { return ForeignList<T>(&handle_); }

    [[nodiscard]] std::size_t size() const noexcept {
        return handle_ ? static_cast<std::size_t>(slurm_list_count(handle_)) : 0;
    }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
    [[nodiscard]] ListIterator<T> iter() const { return ListIterator<T>(handle_); }

private:
    SlurmListHandle handle_ = nullptr;
};

}
