#ifndef SEQLIST_LIST_HPP
#define SEQLIST_LIST_HPP

#include <functional>
#include <memory>
#include <utility>

#include "common.hpp"

namespace seqlist {

// The capability set shared by every backing implementation. Callers that only
// need ordered, index addressable storage should depend on this and nothing else.
//
// Indices are zero based. Every indexed operation accepts 0 <= index < size(),
// anything else fails with IndexOutOfBounds and leaves the list untouched.
// contains() and remove() compare handle identity, never values.
template<typename T>
class List {
public:
    using value_type = T;
    using handle_type = Handle<T>;

    List() = default;
    virtual ~List() = default;

    // append at the tail, O(1)
    virtual void add(Handle<T> item) = 0;

    void add_raw(T item) {
        add(std::make_shared<T>(std::move(item)));
    }

    // after success get(index) returns `item`
    virtual Result<void> insert_at(Handle<T> item, index_type index) = 0;

    Result<void> insert_raw_at(T item, index_type index) {
        return insert_at(std::make_shared<T>(std::move(item)), index);
    }

    virtual Result<Handle<T>> get(index_type index) const = 0;

    // OperationOnEmptyList on an empty list, ElementNotFound when `item` is not stored
    virtual Result<void> remove(const Handle<T>& item) = 0;

    virtual Result<Handle<T>> remove_at(index_type index) = 0;

    [[nodiscard]] virtual bool contains(const Handle<T>& item) const = 0;

    [[nodiscard]] virtual index_type size() const noexcept = 0;

    [[nodiscard]] bool is_empty() const noexcept { return size() < 1; }

    // remove the head / the tail. both fail with OperationOnEmptyList on an empty list.
    virtual Result<Handle<T>> shift() = 0;
    virtual Result<Handle<T>> pop() = 0;

    [[nodiscard]] Result<void> index_check(index_type index) const noexcept {
        if (index < 0 || size() <= index) {
            return fail(ListError::IndexOutOfBounds);
        }
        return {};
    }

    // forward walk from the current head
    virtual void for_each(const std::function<void(const Handle<T>&)>& fn) const = 0;

    // new nodes, same handles, same order
    [[nodiscard]] virtual std::unique_ptr<List<T>> clone() const = 0;

    // walks every link and checks the structural invariants.
    // UnexpectedError means the implementation is broken, not the caller.
    [[nodiscard]] virtual Result<void> validate() const = 0;

protected:
    List(const List&) = default;
    List& operator=(const List&) = default;
    List(List&&) noexcept = default;
    List& operator=(List&&) noexcept = default;
};

} // namespace seqlist

#endif // SEQLIST_LIST_HPP
