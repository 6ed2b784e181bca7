// core/deque.h - Growable ring-buffer double-ended queue
// Part of the arkham board-structures library (C++20)
//
// DESIGN RATIONALE:
// Every deck in the game draws and returns cards at both ends.  deque
// provides exactly that access pattern: enqueue/dequeue/peek at the
// front and rear, size, and front-to-rear iteration (used to copy the
// contents out for shuffling).
//
// IMPLEMENTATION STRATEGY:
// Ring buffer over std::vector<std::optional<T>> + head index + size.
// - std::optional keeps T free of a default-constructor requirement and
//   lets a dequeued slot release its value immediately
// - No placement new, no manual destructor calls
// - std::vector handles all memory management
//
// Growth is geometric per the growth policy, so enqueue is O(1)
// amortized; dequeue and peek are O(1).  Storage never shrinks
// implicitly.
//
// Key properties:
// - Order at each end is preserved
// - size() == successful enqueues - successful dequeues
// - dequeue/peek on empty throws empty_deque_error, deque unchanged

#ifndef ARKHAM_CORE_DEQUE_H
#define ARKHAM_CORE_DEQUE_H

#include "errors.h"
#include "growth_policy.h"

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace arkham {

/// Double-ended queue with O(1) amortized operations at both ends.
///
/// Template parameters:
/// - T: element type (move constructible)
/// - Growth: a growth_policy (default growth::standard)
///
/// Example:
/// ```cpp
/// deque<int> d;
/// d.enqueue_rear(1);
/// d.enqueue_rear(2);
/// d.enqueue_front(0);
/// d.dequeue_front();   // 0
/// d.dequeue_rear();    // 2
/// d.size();            // 1
/// ```
template<typename T, growth_policy Growth = growth::standard>
    requires std::move_constructible<T>
class deque {
public:
    using value_type = T;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;
    using reference = T&;
    using const_reference = T const&;

    /// Forward iterator over elements, front to rear.
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = T const*;
        using reference = T const&;

        const_iterator() = default;

        reference operator*() const { return owner_->at_logical(pos_); }
        pointer operator->() const { return &owner_->at_logical(pos_); }

        const_iterator& operator++() { ++pos_; return *this; }
        const_iterator operator++(int) { auto tmp = *this; ++pos_; return tmp; }

        friend bool operator==(const_iterator const& a, const_iterator const& b) {
            return a.owner_ == b.owner_ && a.pos_ == b.pos_;
        }

    private:
        friend class deque;
        const_iterator(deque const* owner, size_type pos)
            : owner_(owner), pos_(pos) {}

        deque const* owner_ = nullptr;
        size_type pos_ = 0;
    };

    using iterator = const_iterator;

    // =============================================================================
    // Constructors
    // =============================================================================

    deque() = default;

    /// Build from an ordered sequence: *first becomes the front.
    template<std::input_iterator It, std::sentinel_for<It> S>
    deque(It first, S last) {
        for (; first != last; ++first) {
            enqueue_rear(*first);
        }
    }

    deque(std::initializer_list<T> init) : deque(init.begin(), init.end()) {}

    deque(deque const&) = default;
    deque& operator=(deque const&) = default;

    /// The source is left empty and reusable.
    deque(deque&& o) noexcept
        : slots_(std::move(o.slots_)),
          head_(std::exchange(o.head_, 0)),
          size_(std::exchange(o.size_, 0)) {
        o.slots_.clear();
    }

    deque& operator=(deque&& o) noexcept {
        if (this != &o) {
            slots_ = std::move(o.slots_);
            o.slots_.clear();
            head_ = std::exchange(o.head_, 0);
            size_ = std::exchange(o.size_, 0);
        }
        return *this;
    }

    ~deque() = default;

    // =============================================================================
    // Modifiers
    // =============================================================================

    void enqueue_front(T item) {
        grow_if_full();
        head_ = (head_ + slots_.size() - 1) % slots_.size();
        slots_[head_].emplace(std::move(item));
        ++size_;
    }

    void enqueue_rear(T item) {
        grow_if_full();
        slots_[physical(size_)].emplace(std::move(item));
        ++size_;
    }

    [[nodiscard]] T dequeue_front() {
        if (size_ == 0) {
            throw empty_deque_error("deque::dequeue_front: empty");
        }
        auto& slot = slots_[head_];
        T item = std::move(*slot);
        slot.reset();
        head_ = (head_ + 1) % slots_.size();
        --size_;
        return item;
    }

    [[nodiscard]] T dequeue_rear() {
        if (size_ == 0) {
            throw empty_deque_error("deque::dequeue_rear: empty");
        }
        auto& slot = slots_[physical(size_ - 1)];
        T item = std::move(*slot);
        slot.reset();
        --size_;
        return item;
    }

    /// Drop every element; capacity is kept.
    void clear() noexcept {
        for (auto& slot : slots_) slot.reset();
        head_ = 0;
        size_ = 0;
    }

    // =============================================================================
    // Element Access
    // =============================================================================

    [[nodiscard]] const_reference peek_front() const {
        if (size_ == 0) {
            throw empty_deque_error("deque::peek_front: empty");
        }
        return *slots_[head_];
    }

    [[nodiscard]] const_reference peek_rear() const {
        if (size_ == 0) {
            throw empty_deque_error("deque::peek_rear: empty");
        }
        return *slots_[physical(size_ - 1)];
    }

    // =============================================================================
    // Iterators (front to rear)
    // =============================================================================

    [[nodiscard]] const_iterator begin() const noexcept { return {this, 0}; }
    [[nodiscard]] const_iterator end() const noexcept { return {this, size_}; }
    [[nodiscard]] const_iterator cbegin() const noexcept { return begin(); }
    [[nodiscard]] const_iterator cend() const noexcept { return end(); }

    // =============================================================================
    // Capacity
    // =============================================================================

    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] size_type size() const noexcept { return size_; }
    [[nodiscard]] size_type capacity() const noexcept { return slots_.size(); }

    // =============================================================================
    // Comparison
    // =============================================================================

    friend bool operator==(deque const& a, deque const& b)
        requires std::equality_comparable<T>
    {
        if (a.size_ != b.size_) return false;
        for (size_type i = 0; i < a.size_; ++i) {
            if (!(a.at_logical(i) == b.at_logical(i))) return false;
        }
        return true;
    }

private:
    [[nodiscard]] size_type physical(size_type logical) const noexcept {
        return (head_ + logical) % slots_.size();
    }

    [[nodiscard]] T const& at_logical(size_type logical) const {
        return *slots_[physical(logical)];
    }

    void grow_if_full() {
        if (size_ < slots_.size()) {
            return;
        }
        size_type new_cap = Growth::initial_capacity;
        if (!slots_.empty()) {
            if (slots_.size() > slots_.max_size() / Growth::growth_factor) {
                throw std::length_error("deque: capacity exceeds max_size");
            }
            new_cap = slots_.size() * Growth::growth_factor;
        }

        // Re-lay elements contiguously from index 0.
        std::vector<std::optional<T>> next(new_cap);
        for (size_type i = 0; i < size_; ++i) {
            next[i].emplace(std::move(*slots_[physical(i)]));
        }
        slots_ = std::move(next);
        head_ = 0;
    }

    std::vector<std::optional<T>> slots_;
    size_type head_ = 0;
    size_type size_ = 0;
};

static_assert(std::forward_iterator<deque<int>::const_iterator>);

} // namespace arkham

#endif // ARKHAM_CORE_DEQUE_H
