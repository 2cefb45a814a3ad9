#ifndef SEQLIST_NODE_ITERATOR_HPP
#define SEQLIST_NODE_ITERATOR_HPP

#include <cstddef>
#include <iterator>

#include "common.hpp"

namespace seqlist {

// Forward iterator over any node type with a `content` handle and an owning
// `next` link. Lazy: the next node is only looked up on ++.
template<typename Node, typename T>
class NodeIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Handle<T>;
    using difference_type = std::ptrdiff_t;
    using pointer = const Handle<T>*;
    using reference = const Handle<T>&;

    NodeIterator() noexcept = default;
    explicit NodeIterator(const Node* node) noexcept : current_(node) {}

    reference operator*() const noexcept { return current_->content; }
    pointer operator->() const noexcept { return &current_->content; }

    NodeIterator& operator++() noexcept {
        current_ = current_->next.get();
        return *this;
    }

    NodeIterator operator++(int) noexcept {
        NodeIterator tmp = *this;
        ++*this;
        return tmp;
    }

    bool operator==(const NodeIterator& other) const noexcept {
        return current_ == other.current_;
    }

    bool operator!=(const NodeIterator& other) const noexcept {
        return !(*this == other);
    }

private:
    const Node* current_{nullptr};
};

} // namespace seqlist

#endif // SEQLIST_NODE_ITERATOR_HPP
