#ifndef SEQLIST_SINGLY_LINKED_LIST_HPP
#define SEQLIST_SINGLY_LINKED_LIST_HPP

#include <functional>
#include <memory>
#include <utility>

#include "common.hpp"
#include "list.hpp"
#include "logging.hpp"
#include "node_iterator.hpp"

namespace seqlist {

// List backed by nodes with a single forward link. Each node owns its
// successor, the list owns the head and keeps a non-owning pointer to the tail.
// Anything that needs a predecessor has to walk from the head.
template<typename T>
class SinglyLinkedList final : public List<T> {
    struct Node {
        explicit Node(Handle<T> c) : content(std::move(c)) {}

        Handle<T> content;
        std::unique_ptr<Node> next;
    };

public:
    using iterator = NodeIterator<Node, T>;
    using const_iterator = iterator;

    SinglyLinkedList() = default;
    ~SinglyLinkedList() override { clear(); }

    // structural copy: new nodes, same handles
    SinglyLinkedList(const SinglyLinkedList& other) : List<T>() {
        for (const auto& item : other) {
            add(item);
        }
    }

    SinglyLinkedList& operator=(const SinglyLinkedList& other) {
        if (this != &other) {
            SinglyLinkedList tmp(other);
            swap(tmp);
        }
        return *this;
    }

    SinglyLinkedList(SinglyLinkedList&& other) noexcept
        : List<T>()
        , head_(std::move(other.head_))
        , tail_(std::exchange(other.tail_, nullptr))
        , size_(std::exchange(other.size_, 0)) {}

    SinglyLinkedList& operator=(SinglyLinkedList&& other) noexcept {
        if (this != &other) {
            clear();
            head_ = std::move(other.head_);
            tail_ = std::exchange(other.tail_, nullptr);
            size_ = std::exchange(other.size_, 0);
        }
        return *this;
    }

    void swap(SinglyLinkedList& other) noexcept {
        std::swap(head_, other.head_);
        std::swap(tail_, other.tail_);
        std::swap(size_, other.size_);
    }

    [[nodiscard]] iterator begin() const noexcept { return iterator(head_.get()); }
    [[nodiscard]] iterator end() const noexcept { return iterator(); }

    void add(Handle<T> item) override {
        auto node = std::make_unique<Node>(std::move(item));
        Node* raw = node.get();

        if (tail_) {
            tail_->next = std::move(node);
        } else {
            // empty: the new node is head and tail at once
            head_ = std::move(node);
        }
        tail_ = raw;
        ++size_;
    }

    Result<void> insert_at(Handle<T> item, index_type index) override {
        if (auto ok = this->index_check(index); !ok) {
            return std::unexpected(ok.error());
        }

        auto node = std::make_unique<Node>(std::move(item));

        if (index == 0) {
            node->next = std::move(head_);
            head_ = std::move(node);
            ++size_;
            return {};
        }

        auto prev = node_at(index - 1);
        if (!prev) {
            return std::unexpected(prev.error());
        }
        Node* p = *prev;

        if (index == size_ - 1) {
            // in front of the tail, the tail itself stays put
            if (p->next.get() != tail_) {
                return invariant_violation("node {} is not followed by the tail (size {})",
                                           index - 1, size_);
            }
        } else if (!p->next) {
            return invariant_violation("interior node {} has no successor (size {})",
                                       index - 1, size_);
        }

        node->next = std::move(p->next);
        p->next = std::move(node);
        ++size_;
        return {};
    }

    Result<Handle<T>> get(index_type index) const override {
        auto node = node_at(index);
        if (!node) {
            return std::unexpected(node.error());
        }
        return (*node)->content;
    }

    Result<void> remove(const Handle<T>& item) override {
        if (!head_) {
            return fail(ListError::OperationOnEmptyList);
        }

        if (same_handle(head_->content, item)) {
            auto removed = shift();
            if (!removed) {
                return std::unexpected(removed.error());
            }
            return {};
        }

        // look for the node before the one holding `item`
        Node* prev = head_.get();
        while (prev->next && !same_handle(prev->next->content, item)) {
            prev = prev->next.get();
        }
        if (!prev->next) {
            return fail(ListError::ElementNotFound);
        }

        unlink_after(*prev);
        return {};
    }

    Result<Handle<T>> remove_at(index_type index) override {
        if (auto ok = this->index_check(index); !ok) {
            return std::unexpected(ok.error());
        }

        if (index == 0) {
            return shift();
        }
        if (index == size_ - 1) {
            return pop();
        }

        auto prev = node_at(index - 1);
        if (!prev) {
            return std::unexpected(prev.error());
        }
        Node* p = *prev;
        if (!p->next || !p->next->next) {
            return invariant_violation("interior node {} lost its neighbours (size {})",
                                       index, size_);
        }

        return std::move(unlink_after(*p)->content);
    }

    [[nodiscard]] bool contains(const Handle<T>& item) const override {
        for (const Node* cur = head_.get(); cur; cur = cur->next.get()) {
            if (same_handle(cur->content, item)) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] index_type size() const noexcept override { return size_; }

    Result<Handle<T>> shift() override {
        if (!head_) {
            return fail(ListError::OperationOnEmptyList);
        }

        auto old = std::move(head_);
        head_ = std::move(old->next);
        if (!head_) {
            tail_ = nullptr;
        }
        --size_;
        return std::move(old->content);
    }

    Result<Handle<T>> pop() override {
        if (!tail_) {
            return fail(ListError::OperationOnEmptyList);
        }
        if (size_ == 1) {
            return shift();
        }

        // no back link: re-walk to the node before the tail
        auto prev = node_at(size_ - 2);
        if (!prev) {
            return std::unexpected(prev.error());
        }
        Node* p = *prev;
        if (p->next.get() != tail_) {
            return invariant_violation("node {} is not followed by the tail (size {})",
                                       size_ - 2, size_);
        }

        auto old = std::move(p->next);
        tail_ = p;
        --size_;
        return std::move(old->content);
    }

    void for_each(const std::function<void(const Handle<T>&)>& fn) const override {
        for (const Node* cur = head_.get(); cur; cur = cur->next.get()) {
            fn(cur->content);
        }
    }

    [[nodiscard]] std::unique_ptr<List<T>> clone() const override {
        return std::make_unique<SinglyLinkedList>(*this);
    }

    [[nodiscard]] Result<void> validate() const override {
        if (!head_ || !tail_) {
            if (head_ || tail_ || size_ != 0) {
                return invariant_violation("head/tail disagree on emptiness (size {})", size_);
            }
            return {};
        }

        index_type count = 0;
        const Node* last = nullptr;
        for (const Node* cur = head_.get(); cur; cur = cur->next.get()) {
            if (++count > size_) {
                return invariant_violation("more than {} nodes reachable from head", size_);
            }
            last = cur;
        }

        if (count != size_) {
            return invariant_violation("{} nodes reachable, size says {}", count, size_);
        }
        if (last != tail_) {
            return invariant_violation("last reachable node is not the tail (size {})", size_);
        }
        return {};
    }

private:
    std::unique_ptr<Node> head_;
    Node* tail_{nullptr};
    index_type size_{0};

    Result<Node*> node_at(index_type index) const {
        if (auto ok = this->index_check(index); !ok) {
            return std::unexpected(ok.error());
        }

        Node* cur = head_.get();
        for (index_type i = 0; i < index; ++i) {
            if (!cur || !cur->next) {
                return invariant_violation("node {} has no successor (size {})", i, size_);
            }
            cur = cur->next.get();
        }
        if (!cur) {
            return invariant_violation("head missing on a list of size {}", size_);
        }
        return cur;
    }

    // detaches prev.next, caller guarantees it exists
    std::unique_ptr<Node> unlink_after(Node& prev) noexcept {
        auto target = std::move(prev.next);
        prev.next = std::move(target->next);
        if (tail_ == target.get()) {
            tail_ = &prev;
        }
        --size_;
        return target;
    }

    // iterative so long lists don't recurse through unique_ptr destructors
    void clear() noexcept {
        while (head_) {
            head_ = std::move(head_->next);
        }
        tail_ = nullptr;
        size_ = 0;
    }
};

} // namespace seqlist

#endif // SEQLIST_SINGLY_LINKED_LIST_HPP
