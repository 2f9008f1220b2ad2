#include "slot_pool.hpp"

#include <stdexcept>
#include <string>

namespace partbuf
{

namespace
{

// Index of the lowest zero bit; w must not be all ones.
inline std::uint32_t lowest_zero_bit(std::uint64_t w) noexcept
{
    return static_cast<std::uint32_t>(__builtin_ctzll(~w));
}

std::size_t word_count(std::uint32_t capacity)
{
    if (capacity == 0 || capacity > SlotPool::MAX_CAPACITY)
        throw std::invalid_argument("SlotPool capacity must be in [1, 2^31 - 1], got " +
                                    std::to_string(capacity));
    return (static_cast<std::size_t>(capacity) + 63) / 64;
}

} // namespace

SlotPool::SlotPool(std::uint32_t capacity)
    : words_(word_count(capacity), 0), capacity_(capacity), used_(0), hint_(0)
{
    // Bits past the end of the last word are permanently taken.
    std::uint32_t tail = capacity % WORD_BITS;
    if (tail != 0)
        words_.back() = ~0ull << tail;
}

std::optional<SlotPool::Slot> SlotPool::acquire() noexcept
{
    if (used_ == capacity_)
        return std::nullopt;
    for (std::size_t i = hint_; i < words_.size(); ++i)
    {
        if (words_[i] == ~0ull)
            continue;
        std::uint32_t bit = lowest_zero_bit(words_[i]);
        words_[i] |= 1ull << bit;
        ++used_;
        hint_ = i;
        return static_cast<Slot>(i * WORD_BITS + bit);
    }
    return std::nullopt;
}

void SlotPool::release(Slot slot)
{
    if (slot >= capacity_)
        throw std::out_of_range("SlotPool::release: slot " + std::to_string(slot) +
                                " outside pool of " + std::to_string(capacity_));
    std::size_t i = slot / WORD_BITS;
    std::uint64_t mask = 1ull << (slot % WORD_BITS);
    if (!(words_[i] & mask))
        throw std::logic_error("SlotPool::release: slot " + std::to_string(slot) + " is not in use");
    words_[i] &= ~mask;
    --used_;
    if (i < hint_)
        hint_ = i;
}

void SlotPool::clear() noexcept
{
    for (auto &w : words_)
        w = 0;
    std::uint32_t tail = capacity_ % WORD_BITS;
    if (tail != 0)
        words_.back() = ~0ull << tail;
    used_ = 0;
    hint_ = 0;
}

bool SlotPool::in_use(Slot slot) const noexcept
{
    if (slot >= capacity_)
        return false;
    return (words_[slot / WORD_BITS] >> (slot % WORD_BITS)) & 1ull;
}

} // namespace partbuf
