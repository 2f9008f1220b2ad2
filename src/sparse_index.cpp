#include "sparse_index.hpp"

#include <string>

#include "errors.hpp"

namespace partbuf
{

namespace
{

std::uint32_t checked_capacity(const ColumnView &dense)
{
    if (dense.length() == 0)
        throw ValidationError("cannot create a sparse index over a zero-length column");
    if (dense.length() > SlotPool::MAX_CAPACITY)
        throw ValidationError("sparse index capacity " + std::to_string(dense.length()) +
                              " exceeds the slot pool maximum");
    return dense.length();
}

std::size_t checked_key_table_size(SparseIndex::Key max_key)
{
    if (max_key < 0 || max_key > BoundedSparseIndex::MAX_BOUNDED_KEY)
        throw ValidationError("max_key must be in [0, " +
                              std::to_string(BoundedSparseIndex::MAX_BOUNDED_KEY) + "], got " +
                              std::to_string(max_key));
    return static_cast<std::size_t>(max_key) + 1;
}

} // namespace

SparseIndex::SparseIndex(ColumnView dense)
    : dense_(dense), pool_(checked_capacity(dense))
{
}

std::optional<double> SparseIndex::get(Key key) const
{
    if (!accepts(key))
        return std::nullopt;
    auto slot = slot_of(key);
    if (!slot)
        return std::nullopt;
    return dense_.get(*slot);
}

bool SparseIndex::contains(Key key) const
{
    return accepts(key) && slot_of(key).has_value();
}

bool SparseIndex::set(Key key, double value)
{
    if (!accepts(key))
        return false;
    if (auto slot = slot_of(key))
    {
        dense_.set(*slot, value);
        return true;
    }
    auto slot = pool_.acquire();
    if (!slot)
        return false;
    try
    {
        bind_(key, *slot);
    }
    catch (...)
    {
        pool_.release(*slot);
        throw;
    }
    dense_.set(*slot, value);
    return true;
}

bool SparseIndex::erase(Key key)
{
    if (key == DISPOSE_KEY)
    {
        dispose();
        return true;
    }
    if (!accepts(key))
        return false;
    auto slot = slot_of(key);
    if (!slot)
        return false;
    dense_.set(*slot, 0.0);
    unbind_(key, *slot);
    pool_.release(*slot);
    return true;
}

void SparseIndex::dispose() noexcept
{
    clear_mapping_();
    pool_.clear();
    dense_.fill(0.0);
}

// ---- HashedSparseIndex ----

HashedSparseIndex::HashedSparseIndex(ColumnView dense)
    : SparseIndex(dense), map_(dense.length() < 64 ? dense.length() : 64)
{
}

void HashedSparseIndex::for_each(const std::function<void(Key, double)> &f) const
{
    map_.for_each([&](KeySlotMap::Key k, KeySlotMap::Slot s)
                  { f(static_cast<Key>(k), dense_.get(s)); });
}

std::optional<SparseIndex::Slot> HashedSparseIndex::slot_of(Key key) const noexcept
{
    return map_.find(static_cast<KeySlotMap::Key>(key));
}

void HashedSparseIndex::bind_(Key key, Slot slot)
{
    map_.insert(static_cast<KeySlotMap::Key>(key), slot);
}

void HashedSparseIndex::unbind_(Key key, Slot) noexcept
{
    map_.erase(static_cast<KeySlotMap::Key>(key));
}

void HashedSparseIndex::clear_mapping_() noexcept
{
    map_.clear();
}

// ---- BoundedSparseIndex ----

BoundedSparseIndex::BoundedSparseIndex(ColumnView dense, Key max_key)
    : SparseIndex(dense), max_key_(max_key),
      key_to_slot_(checked_key_table_size(max_key), NO_SLOT),
      slot_to_key_(dense.length(), NO_KEY)
{
}

void BoundedSparseIndex::for_each(const std::function<void(Key, double)> &f) const
{
    for (Slot s = 0; s < slot_to_key_.size(); ++s)
        if (slot_to_key_[s] != NO_KEY)
            f(static_cast<Key>(slot_to_key_[s]), dense_.get(s));
}

std::optional<SparseIndex::Slot> BoundedSparseIndex::slot_of(Key key) const noexcept
{
    std::uint32_t s = key_to_slot_[static_cast<std::size_t>(key)];
    if (s == NO_SLOT)
        return std::nullopt;
    return s;
}

void BoundedSparseIndex::bind_(Key key, Slot slot)
{
    key_to_slot_[static_cast<std::size_t>(key)] = slot;
    slot_to_key_[slot] = static_cast<std::uint64_t>(key);
}

void BoundedSparseIndex::unbind_(Key key, Slot slot) noexcept
{
    key_to_slot_[static_cast<std::size_t>(key)] = NO_SLOT;
    slot_to_key_[slot] = NO_KEY;
}

void BoundedSparseIndex::clear_mapping_() noexcept
{
    // Only keys that hold a slot can have a forward entry.
    for (auto &k : slot_to_key_)
    {
        if (k != NO_KEY)
        {
            key_to_slot_[static_cast<std::size_t>(k)] = NO_SLOT;
            k = NO_KEY;
        }
    }
}

std::unique_ptr<SparseIndex> make_sparse_index(ColumnView dense, std::optional<SparseIndex::Key> max_key)
{
    if (max_key)
        return std::make_unique<BoundedSparseIndex>(dense, *max_key);
    return std::make_unique<HashedSparseIndex>(dense);
}

} // namespace partbuf
