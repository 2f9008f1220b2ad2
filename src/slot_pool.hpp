#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace partbuf
{

// Fixed-size pool of integer slots [0, capacity), tracked one bit per slot.
// acquire() hands out the lowest free slot; release() returns it to the pool.
class SlotPool
{
public:
    using Slot = std::uint32_t;

    static constexpr std::uint32_t MAX_CAPACITY = 0x7fffffffu; // 2^31 - 1

    explicit SlotPool(std::uint32_t capacity);

    std::optional<Slot> acquire() noexcept;

    // Throws std::out_of_range for a slot outside the pool and
    // std::logic_error for a slot that is not currently in use.
    void release(Slot slot);

    // Marks every slot free again. No allocation.
    void clear() noexcept;

    bool in_use(Slot slot) const noexcept;

    std::uint32_t capacity() const noexcept { return capacity_; }
    std::uint32_t size() const noexcept { return used_; }
    std::uint32_t available() const noexcept { return capacity_ - used_; }
    bool full() const noexcept { return used_ == capacity_; }

private:
    static constexpr std::uint32_t WORD_BITS = 64;

    std::vector<std::uint64_t> words_;
    std::uint32_t capacity_;
    std::uint32_t used_;
    std::size_t hint_; // no free bit lives in a word before this one
};

} // namespace partbuf
