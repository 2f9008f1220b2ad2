#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "column_view.hpp"
#include "hash.hpp"
#include "slot_pool.hpp"

namespace partbuf
{

// Maps a sparse key space onto a small dense column. Each present key owns one
// slot of the column; slots are recycled through a SlotPool.
//
// Bad keys and a full pool are ordinary outcomes here: set() and erase()
// report them by returning false, get() by returning nullopt.
class SparseIndex
{
public:
    using Key = std::int64_t;
    using Slot = SlotPool::Slot;

    // erase(DISPOSE_KEY) disposes the whole index.
    static constexpr Key DISPOSE_KEY = -1;
    // Largest key any index accepts (2^53 - 1).
    static constexpr Key MAX_SAFE_KEY = (Key(1) << 53) - 1;

    virtual ~SparseIndex() = default;

    SparseIndex(const SparseIndex &) = delete;
    SparseIndex &operator=(const SparseIndex &) = delete;

    std::optional<double> get(Key key) const;
    bool set(Key key, double value);
    bool erase(Key key);
    bool contains(Key key) const;

    // Forgets every key, frees every slot and zeroes the dense column.
    // The index stays usable.
    void dispose() noexcept;

    // Calls f(key, value) for every present key, in no particular order.
    virtual void for_each(const std::function<void(Key, double)> &f) const = 0;

    // Whether key is inside the key domain of this index.
    virtual bool accepts(Key key) const noexcept = 0;
    virtual bool bounded() const noexcept = 0;

    std::uint32_t capacity() const noexcept { return pool_.capacity(); }
    std::uint32_t size() const noexcept { return pool_.size(); }
    bool empty() const noexcept { return pool_.size() == 0; }
    bool full() const noexcept { return pool_.full(); }

    const ColumnView &dense() const noexcept { return dense_; }

protected:
    explicit SparseIndex(ColumnView dense);

    virtual std::optional<Slot> slot_of(Key key) const noexcept = 0;
    virtual void bind_(Key key, Slot slot) = 0;
    virtual void unbind_(Key key, Slot slot) noexcept = 0;
    virtual void clear_mapping_() noexcept = 0;

    ColumnView dense_;
    SlotPool pool_;
};

// Unbounded key domain; one hash entry per present key.
class HashedSparseIndex final : public SparseIndex
{
public:
    explicit HashedSparseIndex(ColumnView dense);

    void for_each(const std::function<void(Key, double)> &f) const override;
    bool accepts(Key key) const noexcept override { return key >= 0 && key <= MAX_SAFE_KEY; }
    bool bounded() const noexcept override { return false; }

private:
    std::optional<Slot> slot_of(Key key) const noexcept override;
    void bind_(Key key, Slot slot) override;
    void unbind_(Key key, Slot slot) noexcept override;
    void clear_mapping_() noexcept override;

    KeySlotMap map_;
};

// Keys limited to [0, max_key]. Both tables are sized up front, so
// set/get/erase/dispose never allocate.
class BoundedSparseIndex final : public SparseIndex
{
public:
    // Keeps the key table addressable with 32-bit slots.
    static constexpr Key MAX_BOUNDED_KEY = 0xfffffffell;

    BoundedSparseIndex(ColumnView dense, Key max_key);

    void for_each(const std::function<void(Key, double)> &f) const override;
    bool accepts(Key key) const noexcept override { return key >= 0 && key <= max_key_; }
    bool bounded() const noexcept override { return true; }

    Key max_key() const noexcept { return max_key_; }

private:
    static constexpr std::uint32_t NO_SLOT = 0xffffffffu;
    static constexpr std::uint64_t NO_KEY = ~0ull;

    std::optional<Slot> slot_of(Key key) const noexcept override;
    void bind_(Key key, Slot slot) override;
    void unbind_(Key key, Slot slot) noexcept override;
    void clear_mapping_() noexcept override;

    Key max_key_;
    std::vector<std::uint32_t> key_to_slot_;
    std::vector<std::uint64_t> slot_to_key_;
};

// Bounded mode when max_key is given, hashed mode otherwise.
std::unique_ptr<SparseIndex> make_sparse_index(ColumnView dense,
                                               std::optional<SparseIndex::Key> max_key = std::nullopt);

} // namespace partbuf
