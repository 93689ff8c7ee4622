/**
 * @file local_extremum_buffer.hpp
 * @brief Sliding-window running maximum / minimum over a scan line
 * @details The buffer keeps the extremum of the last N pushed samples.
 *          Candidates are held in a monotonic ring of (value, position)
 *          pairs: a push evicts every trailing candidate it dominates, so
 *          the front is always the extremum and the ring never holds more
 *          than N entries. Each sample enters and leaves the ring at most
 *          once, giving amortized O(1) cost per push.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace volmorph::services {

/**
 * @brief Fixed-capacity sliding window tracking a running extremum
 *
 * @tparam T Sample type
 * @tparam Dominates Strict ordering; Dominates(a, b) means a wins over b
 *         (std::greater for a running maximum, std::less for a minimum)
 *
 * Storage is allocated once at construction; fill() and add() never
 * allocate.
 *
 * @code
 * LocalMaxBuffer<int> window(3);
 * window.fill(0);
 * window.add(4);
 * window.add(1);
 * window.getMax();  // 4
 * @endcode
 */
template <typename T, typename Dominates>
class LocalExtremumBuffer {
public:
    /**
     * @param capacity Window length (clamped to at least 1)
     */
    explicit LocalExtremumBuffer(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity),
          ring_(capacity_) {}

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    /// Number of candidates currently held (at most capacity())
    [[nodiscard]] std::size_t candidateCount() const noexcept { return count_; }

    /**
     * @brief Reset the window so that every slot holds @p value
     */
    void fill(T value) noexcept {
        head_ = 0;
        count_ = 0;
        position_ = 0;
        // Equal fill slots are dominated by the newest one
        pushBack(value, position_);
    }

    /**
     * @brief Push a sample, evicting the oldest slot of the window
     */
    void add(T value) noexcept {
        ++position_;

        // Age out before appending so the ring never exceeds capacity
        const std::int64_t oldestInWindow =
            position_ - static_cast<std::int64_t>(capacity_) + 1;
        while (count_ > 0 && front().position < oldestInWindow) {
            head_ = (head_ + 1) % capacity_;
            --count_;
        }

        while (count_ > 0 && !dominates_(back().value, value)) {
            --count_;
        }
        pushBack(value, position_);
    }

    /// Current extremum of the window
    [[nodiscard]] T value() const noexcept { return front().value; }

private:
    struct Candidate {
        T value{};
        std::int64_t position = 0;
    };

    [[nodiscard]] const Candidate& front() const noexcept { return ring_[head_]; }

    [[nodiscard]] const Candidate& back() const noexcept {
        return ring_[(head_ + count_ - 1) % capacity_];
    }

    void pushBack(T value, std::int64_t position) noexcept {
        auto& slot = ring_[(head_ + count_) % capacity_];
        slot.value = value;
        slot.position = position;
        ++count_;
    }

    std::size_t capacity_;
    std::vector<Candidate> ring_;
    std::size_t head_ = 0;
    std::size_t count_ = 0;
    std::int64_t position_ = 0;
    [[no_unique_address]] Dominates dominates_{};
};

/**
 * @brief Sliding window tracking the running maximum
 */
template <typename T>
class LocalMaxBuffer : public LocalExtremumBuffer<T, std::greater<T>> {
public:
    using LocalExtremumBuffer<T, std::greater<T>>::LocalExtremumBuffer;

    [[nodiscard]] T getMax() const noexcept { return this->value(); }
};

/**
 * @brief Sliding window tracking the running minimum
 */
template <typename T>
class LocalMinBuffer : public LocalExtremumBuffer<T, std::less<T>> {
public:
    using LocalExtremumBuffer<T, std::less<T>>::LocalExtremumBuffer;

    [[nodiscard]] T getMin() const noexcept { return this->value(); }
};

}  // namespace volmorph::services
