#ifndef DLIST_LIST_HPP
#define DLIST_LIST_HPP

#include <cassert>
#include <cstddef>
#include <cstdlib>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include "common.hpp"
#include "logging.hpp"

namespace dlist {

// Defined by the unit tests to reach into a list and break its links on purpose.
struct DoublyLinkedListTestAccess;

// Thrown by DoublyLinkedList::get when the index is outside [0, size()).
class IndexOutOfRange : public std::out_of_range {
public:
    IndexOutOfRange(std::ptrdiff_t index, std::size_t size)
        : std::out_of_range(format_message("index {} out of range for list of length {}", index, size)),
          index_(index),
          size_(size) {}

    [[nodiscard]] std::ptrdiff_t index() const noexcept { return index_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

private:
    std::ptrdiff_t index_;
    std::size_t size_;
};

/*
 * Doubly linked list with O(1) push/pop at both ends and O(1) size().
 *
 *   head_ --owns--> [a] --owns--> [b] --owns--> [c] <-- tail_
 *                    ^-----prev----'  ^----prev--'
 *
 * next links own the node after them, prev links and tail_ are plain pointers,
 * so the ownership graph is a single chain and can never form a cycle.
 */
template<typename T>
class DoublyLinkedList {
private:
    struct Node {
        template<typename... Args>
        explicit Node(std::in_place_t, Args&&... args) : value(std::forward<Args>(args)...) {}

        T value;
        std::unique_ptr<Node> next; // owning, empty at the tail
        Node* prev{nullptr};        // non-owning, null at the head
    };

public:
    // Read-only forward cursor. Any append/pop/clear on the list while an
    // Iterator is live leaves that Iterator undefined.
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        Iterator() noexcept = default;

        reference operator*() const noexcept { return current_->value; }
        pointer operator->() const noexcept { return &current_->value; }

        Iterator& operator++() noexcept {
            current_ = current_->next.get();
            return *this;
        }

        Iterator operator++(int) noexcept {
            Iterator tmp = *this;
            ++*this;
            return tmp;
        }

        bool operator==(const Iterator& other) const noexcept {
            return current_ == other.current_;
        }

        bool operator!=(const Iterator& other) const noexcept {
            return !(*this == other);
        }

    private:
        explicit Iterator(const Node* node) noexcept : current_(node) {}

        const Node* current_{nullptr};
        friend class DoublyLinkedList;
    };

    using value_type = T;
    using size_type = std::size_t;
    using iterator = Iterator;
    using const_iterator = Iterator;

    DoublyLinkedList() = default;
    ~DoublyLinkedList() { clear(); }

    DoublyLinkedList(const DoublyLinkedList&) = delete;
    DoublyLinkedList& operator=(const DoublyLinkedList&) = delete;

    DoublyLinkedList(DoublyLinkedList&& other) noexcept
        : head_(std::move(other.head_)),
          tail_(std::exchange(other.tail_, nullptr)),
          length_(std::exchange(other.length_, 0)) {}

    DoublyLinkedList& operator=(DoublyLinkedList&& other) noexcept {
        if (this != &other) {
            clear();
            head_ = std::move(other.head_);
            tail_ = std::exchange(other.tail_, nullptr);
            length_ = std::exchange(other.length_, 0);
        }
        return *this;
    }

    void append_left(T value) { emplace_left(std::move(value)); }
    void append_right(T value) { emplace_right(std::move(value)); }

    template<typename... Args>
    T& emplace_left(Args&&... args) {
        auto node = std::make_unique<Node>(std::in_place, std::forward<Args>(args)...);
        Node* added = node.get();
        if (!head_) {
            tail_ = added;
        } else {
            head_->prev = added;
            node->next = std::move(head_);
        }
        head_ = std::move(node);
        ++length_;
        check_after_mutation();
        return added->value;
    }

    template<typename... Args>
    T& emplace_right(Args&&... args) {
        auto node = std::make_unique<Node>(std::in_place, std::forward<Args>(args)...);
        Node* added = node.get();
        if (!tail_) {
            head_ = std::move(node);
        } else {
            node->prev = tail_;
            tail_->next = std::move(node);
        }
        tail_ = added;
        ++length_;
        check_after_mutation();
        return added->value;
    }

    // An empty list is not an error here: both pops return nullopt and change nothing.
    std::optional<T> pop_left() {
        if (!head_) {
            return std::nullopt;
        }
        std::optional<T> removed(std::move(head_->value));
        if (head_.get() == tail_) {
            head_.reset();
            tail_ = nullptr;
            length_ = 0;
        } else {
            head_ = std::move(head_->next);
            assert(head_ != nullptr && "pop_left: second node missing");
            head_->prev = nullptr;
            --length_;
        }
        check_after_mutation();
        return removed;
    }

    std::optional<T> pop_right() {
        if (!tail_) {
            return std::nullopt;
        }
        std::optional<T> removed(std::move(tail_->value));
        if (head_.get() == tail_) {
            head_.reset();
            tail_ = nullptr;
            length_ = 0;
        } else {
            Node* before = tail_->prev;
            assert(before != nullptr && "pop_right: tail has no prev");
            before->next.reset(); // destroys the old tail
            tail_ = before;
            --length_;
        }
        check_after_mutation();
        return removed;
    }

    // Element at a zero-based position, walking from whichever end is closer.
    // Throws IndexOutOfRange unless 0 <= index < size().
    [[nodiscard]] const T& get(std::ptrdiff_t index) const { return node_at(index)->value; }
    [[nodiscard]] T& get(std::ptrdiff_t index) { return node_at(index)->value; }

    [[nodiscard]] std::size_t size() const noexcept { return length_; }
    [[nodiscard]] bool empty() const noexcept { return length_ == 0; }

    [[nodiscard]] Iterator begin() const noexcept { return Iterator(head_.get()); }
    [[nodiscard]] Iterator end() const noexcept { return Iterator(nullptr); }

    // Frees front to back one node at a time. Each node is detached before it
    // dies, so no unique_ptr destructor ever recurses down the chain.
    void clear() noexcept {
        while (head_) {
            head_ = std::move(head_->next);
        }
        tail_ = nullptr;
        length_ = 0;
    }

    // Walks the whole chain and checks head/tail/length/link consistency.
    // Logs the first violation found and returns false.
    [[nodiscard]] bool validate() const {
        if ((head_ == nullptr) != (tail_ == nullptr)) {
            log_message("head and tail disagree on emptiness (head {}, tail {})",
                        head_ ? "set" : "null", tail_ ? "set" : "null");
            return false;
        }
        if (!head_) {
            if (length_ != 0) {
                log_message("empty chain but length is {}", length_);
                return false;
            }
            return true;
        }
        if (head_->prev != nullptr) {
            log_message("head has a prev link");
            return false;
        }
        if (tail_->next) {
            log_message("tail has a next link");
            return false;
        }

        std::size_t count = 0;
        const Node* previous = nullptr;
        for (const Node* current = head_.get(); current; current = current->next.get()) {
            if (current->prev != previous) {
                log_message("prev link of node {} does not point at node {}", count, count - 1);
                return false;
            }
            previous = current;
            if (++count > length_) {
                log_message("chain is longer than length {}", length_);
                return false;
            }
        }
        if (previous != tail_) {
            log_message("last reachable node is not the tail");
            return false;
        }
        if (count != length_) {
            log_message("chain holds {} nodes but length is {}", count, length_);
            return false;
        }
        return true;
    }

private:
    std::unique_ptr<Node> head_;
    Node* tail_{nullptr};
    std::size_t length_{0};

    Node* node_at(std::ptrdiff_t index) const {
        if (index < 0 || static_cast<std::size_t>(index) >= length_) {
            throw IndexOutOfRange(index, length_);
        }
        const auto position = static_cast<std::size_t>(index);

        if (position < length_ / 2) {
            Node* current = head_.get();
            for (std::size_t step = 0; step < position; ++step) {
                assert(current != nullptr && "get: chain shorter than length");
                current = current->next.get();
            }
            assert(current != nullptr && "get: chain shorter than length");
            return current;
        }

        Node* current = tail_;
        for (std::size_t step = 0; step < length_ - position - 1; ++step) {
            assert(current != nullptr && "get: chain shorter than length");
            current = current->prev;
        }
        assert(current != nullptr && "get: chain shorter than length");
        return current;
    }

    // validate() has already logged what broke; a corrupted list is not recoverable.
    void check_after_mutation() const {
        if constexpr (CHECK_INVARIANTS) {
            if (!validate()) {
                std::abort();
            }
        }
    }

    friend struct DoublyLinkedListTestAccess;
};

} // namespace dlist

#endif // DLIST_LIST_HPP
