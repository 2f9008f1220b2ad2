#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <unordered_map>

#include "partition.hpp"

namespace partbuf
{

// A fixed-capacity byte buffer carved into named partitions by bump allocation.
//
// Each partition stores one value per row per property. Property columns start
// on max(width, MIN_ALIGNMENT) boundaries in declaration order, and a partition's
// byte length is rounded up to its widest alignment, so the next partition is
// aligned without extra bookkeeping. Space is only given back by clear().
//
// Not thread-safe; callers sharing the memory must synchronize.
class PartitionedBuffer
{
public:
    // row_count defaults to capacity.
    explicit PartitionedBuffer(std::int64_t capacity);
    PartitionedBuffer(std::int64_t capacity, std::int64_t row_count);
    // Carves caller-owned memory (e.g. a shared mapping) instead of allocating.
    // The memory is zeroed and must outlive the buffer.
    PartitionedBuffer(std::byte *memory, std::int64_t capacity, std::int64_t row_count);

    PartitionedBuffer(const PartitionedBuffer &) = delete;
    PartitionedBuffer(PartitionedBuffer &&) = delete;
    PartitionedBuffer &operator=(const PartitionedBuffer &) = delete;
    PartitionedBuffer &operator=(PartitionedBuffer &&) = delete;

    // Places spec and returns its storage, or nullptr for a tag. Adding the
    // same Partition again returns the existing storage. Throws
    // ValidationError, DuplicateNameError or CapacityError and leaves the
    // buffer untouched on failure.
    PartitionStorage *add_partition(const Partition &spec);

    // Lookups return nullptr for an absent partition; a null spec pointer
    // throws TypeError.
    PartitionStorage *get_partition(std::string_view name);
    const PartitionStorage *get_partition(std::string_view name) const;
    PartitionStorage *get_partition(const Partition *spec);
    const PartitionStorage *get_partition(const Partition *spec) const;
    PartitionStorage *get_partition(const Partition &spec) { return get_partition(&spec); }
    const PartitionStorage *get_partition(const Partition &spec) const { return get_partition(&spec); }

    bool has_partition(std::string_view name) const;
    bool has_partition(const Partition *spec) const;
    bool has_partition(const Partition &spec) const { return has_partition(&spec); }

    // Zeroes every column (disposing sparse ones), forgets every partition
    // and rewinds the cursor. Outstanding storage pointers become invalid.
    void clear() noexcept;

    std::uint32_t free_space() const noexcept { return capacity_ - cursor_; }
    std::uint32_t offset() const noexcept { return cursor_; }
    std::uint32_t capacity() const noexcept { return capacity_; }
    std::uint32_t row_count() const noexcept { return row_count_; }
    std::size_t partition_count() const noexcept { return by_handle_.size(); }

    std::byte *data() noexcept { return data_; }
    const std::byte *data() const noexcept { return data_; }

private:
    static constexpr std::size_t STORE_ALIGNMENT = 64;

    struct AlignedDeleter
    {
        void operator()(std::byte *p) const noexcept
        {
            ::operator delete[](p, std::align_val_t{STORE_ALIGNMENT});
        }
    };

    static std::byte *allocate_(std::uint32_t capacity);
    void validate_spec_(const Partition &spec) const;

    std::unique_ptr<std::byte[], AlignedDeleter> owned_;
    std::byte *data_;
    std::uint32_t capacity_;
    std::uint32_t row_count_;
    std::uint32_t cursor_;
    std::unordered_map<PartitionHandle, std::unique_ptr<PartitionStorage>> by_handle_;
    std::unordered_map<std::string, PartitionStorage *> by_name_;
};

} // namespace partbuf
