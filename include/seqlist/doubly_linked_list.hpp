#ifndef SEQLIST_DOUBLY_LINKED_LIST_HPP
#define SEQLIST_DOUBLY_LINKED_LIST_HPP

#include <functional>
#include <memory>
#include <utility>

#include "common.hpp"
#include "list.hpp"
#include "logging.hpp"
#include "node_iterator.hpp"

namespace seqlist {

// List backed by nodes with a forward and a backward link.
//
// Ownership runs forward only: the list owns the head, every node owns its
// successor. The backward link is a plain pointer used for traversal and
// relinking, so the chain never forms an ownership cycle.
//
// Links are only ever changed through link_nodes(), break_next() and
// break_prev(). Each of them updates both sides of a link, which keeps
// a.next == b  <=>  b.prev == a  true after every operation.
template<typename T>
class DoublyLinkedList final : public List<T> {
    struct Node {
        explicit Node(Handle<T> c) : content(std::move(c)) {}

        Handle<T> content;
        std::unique_ptr<Node> next;
        Node* prev{nullptr};
    };

public:
    using iterator = NodeIterator<Node, T>;
    using const_iterator = iterator;

    DoublyLinkedList() = default;
    ~DoublyLinkedList() override { clear(); }

    DoublyLinkedList(const DoublyLinkedList& other) : List<T>() {
        for (const auto& item : other) {
            add(item);
        }
    }

    DoublyLinkedList& operator=(const DoublyLinkedList& other) {
        if (this != &other) {
            DoublyLinkedList tmp(other);
            swap(tmp);
        }
        return *this;
    }

    DoublyLinkedList(DoublyLinkedList&& other) noexcept
        : List<T>()
        , head_(std::move(other.head_))
        , tail_(std::exchange(other.tail_, nullptr))
        , size_(std::exchange(other.size_, 0)) {}

    DoublyLinkedList& operator=(DoublyLinkedList&& other) noexcept {
        if (this != &other) {
            clear();
            head_ = std::move(other.head_);
            tail_ = std::exchange(other.tail_, nullptr);
            size_ = std::exchange(other.size_, 0);
        }
        return *this;
    }

    void swap(DoublyLinkedList& other) noexcept {
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
            link_nodes(*tail_, std::move(node));
        } else {
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
            link_nodes(*node, std::move(head_));
            head_ = std::move(node);
            ++size_;
            return {};
        }

        // the node currently at `index` moves one step back
        Node* target = nullptr;
        if (index == size_ - 1) {
            target = tail_;
        } else {
            auto found = node_at(index);
            if (!found) {
                return std::unexpected(found.error());
            }
            target = *found;
        }
        if (auto ok = check_interior_prev(*target, index); !ok) {
            return ok;
        }

        auto [prev, owned] = break_prev(*target);
        link_nodes(*node, std::move(owned));
        link_nodes(*prev, std::move(node));
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

        Node* target = head_.get();
        while (target && !same_handle(target->content, item)) {
            target = target->next.get();
        }
        if (!target) {
            return fail(ListError::ElementNotFound);
        }

        Result<Handle<T>> removed;
        if (target == head_.get()) {
            removed = shift();
        } else if (target == tail_) {
            removed = pop();
        } else {
            removed = unlink_interior(*target);
        }
        if (!removed) {
            return std::unexpected(removed.error());
        }
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

        auto node = node_at(index);
        if (!node) {
            return std::unexpected(node.error());
        }
        return unlink_interior(**node);
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
        head_ = break_next(*old);
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

        Node* prev = tail_->prev;
        if (!prev) {
            // singleton: the tail is also the head
            if (tail_ != head_.get()) {
                return invariant_violation("tail has no predecessor but is not the head (size {})",
                                           size_);
            }
            return shift();
        }
        if (prev->next.get() != tail_) {
            return invariant_violation("tail predecessor does not link back to the tail (size {})",
                                       size_);
        }

        auto old = break_next(*prev);
        tail_ = prev;
        --size_;
        return std::move(old->content);
    }

    void for_each(const std::function<void(const Handle<T>&)>& fn) const override {
        for (const Node* cur = head_.get(); cur; cur = cur->next.get()) {
            fn(cur->content);
        }
    }

    [[nodiscard]] std::unique_ptr<List<T>> clone() const override {
        return std::make_unique<DoublyLinkedList>(*this);
    }

    [[nodiscard]] Result<void> validate() const override {
        if (!head_ || !tail_) {
            if (head_ || tail_ || size_ != 0) {
                return invariant_violation("head/tail disagree on emptiness (size {})", size_);
            }
            return {};
        }
        if (head_->prev) {
            return invariant_violation("head has a predecessor (size {})", size_);
        }

        index_type count = 0;
        const Node* last = nullptr;
        for (const Node* cur = head_.get(); cur; cur = cur->next.get()) {
            if (++count > size_) {
                return invariant_violation("more than {} nodes reachable from head", size_);
            }
            if (cur->next && cur->next->prev != cur) {
                return invariant_violation("asymmetric link between nodes {} and {}",
                                           count - 1, count);
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

    // `b` arrives without a predecessor (its old owner already let go of it).
    // Makes b the successor of a and a the predecessor of b.
    // Returns a's former successor, detached.
    static std::unique_ptr<Node> link_nodes(Node& a, std::unique_ptr<Node> b) noexcept {
        auto old_next = break_next(a);
        if (b) {
            b->prev = &a;
        }
        a.next = std::move(b);
        return old_next;
    }

    // Detaches a's successor and clears its back link.
    static std::unique_ptr<Node> break_next(Node& a) noexcept {
        auto next = std::move(a.next);
        if (next) {
            next->prev = nullptr;
        }
        return next;
    }

    // Detaches b from its predecessor and clears the predecessor's forward link.
    // Returns the former predecessor and the ownership of b it was holding.
    static std::pair<Node*, std::unique_ptr<Node>> break_prev(Node& b) noexcept {
        Node* prev = std::exchange(b.prev, nullptr);
        if (!prev) {
            return {nullptr, nullptr};
        }
        return {prev, std::move(prev->next)};
    }

    // everything break_prev/unlink_interior rely on, checked before any link moves
    Result<void> check_interior_prev(const Node& target, index_type index) const {
        if (!target.prev) {
            return invariant_violation("node {} has no predecessor (size {})", index, size_);
        }
        if (target.prev->next.get() != &target) {
            return invariant_violation("node {} and its predecessor disagree (size {})",
                                       index, size_);
        }
        return {};
    }

    // neither head nor tail
    Result<Handle<T>> unlink_interior(Node& target) {
        if (!target.prev || !target.next || target.prev->next.get() != &target) {
            return invariant_violation("interior node lost its neighbours (size {})", size_);
        }

        Node* prev = target.prev;
        auto owned = break_next(*prev);
        auto rest = break_next(*owned);
        link_nodes(*prev, std::move(rest));
        --size_;
        return std::move(owned->content);
    }

    Result<Node*> node_at(index_type index) const {
        if (auto ok = this->index_check(index); !ok) {
            return std::unexpected(ok.error());
        }
        if (index == size_ - 1) {
            return tail_;
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

    void clear() noexcept {
        while (head_) {
            head_ = break_next(*head_);
        }
        tail_ = nullptr;
        size_ = 0;
    }
};

} // namespace seqlist

#endif // SEQLIST_DOUBLY_LINKED_LIST_HPP
