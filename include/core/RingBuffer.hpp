#pragma once
/** @file  RingBuffer.hpp
 *  @brief Fixed-capacity FIFO that overwrites its oldest entry when full.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace zonewatch::core {

  /**
 * @class RingBuffer
 * @brief Bounded queue backing the asynchronous Logger.
 *
 *  * Not thread-safe on its own; the owner serialises access.
 *  * `push()` never blocks: a full buffer drops its oldest element.
 */
  template <typename T> class RingBuffer {
  public:
    explicit RingBuffer(std::size_t capacity) : slots_(capacity) {
      if (capacity == 0)
        throw std::invalid_argument("[RingBuffer] capacity must be > 0");
    }

    /// @returns true if an old element had to be overwritten.
    bool push(T value) {
      bool overwrote = false;
      if (size_ == slots_.size()) {
        head_ = (head_ + 1) % slots_.size();
        --size_;
        overwrote = true;
      }
      slots_[(head_ + size_) % slots_.size()] = std::move(value);
      ++size_;
      return overwrote;
    }

    std::optional<T> pop() {
      if (size_ == 0)
        return std::nullopt;
      T out = std::move(slots_[head_]);
      head_ = (head_ + 1) % slots_.size();
      --size_;
      return out;
    }

    std::size_t size() const { return size_; }
    std::size_t capacity() const { return slots_.size(); }
    bool empty() const { return size_ == 0; }

  private:
    std::vector<T> slots_;
    std::size_t head_{ 0 };
    std::size_t size_{ 0 };
  };

} // namespace zonewatch::core
