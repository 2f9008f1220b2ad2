#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "column_view.hpp"
#include "schema.hpp"
#include "sparse_index.hpp"

namespace partbuf
{

using PartitionHandle = std::uint64_t;

struct PartitionOptions
{
    // Caps how many keys may own a row; makes every column sparse.
    std::optional<std::int64_t> max_owners;
    // Upper bound on keys of a sparse partition; selects the allocation-free
    // bounded index. Requires max_owners.
    std::optional<std::int64_t> max_key;
};

// A named request for a partition. Each constructed Partition gets a fresh
// handle that the buffer uses as its identity; copies share the handle and
// therefore refer to the same partition.
class Partition
{
public:
    // A tag: no schema, no storage.
    explicit Partition(std::string name);
    Partition(std::string name, Schema schema, PartitionOptions opts = {});

    PartitionHandle handle() const noexcept { return handle_; }
    const std::string &name() const noexcept { return name_; }
    const std::optional<Schema> &schema() const noexcept { return schema_; }
    const std::optional<std::int64_t> &max_owners() const noexcept { return opts_.max_owners; }
    const std::optional<std::int64_t> &max_key() const noexcept { return opts_.max_key; }

    bool is_tag() const noexcept { return !schema_.has_value(); }
    bool is_sparse() const noexcept { return opts_.max_owners.has_value(); }

private:
    PartitionHandle handle_;
    std::string name_;
    std::optional<Schema> schema_;
    PartitionOptions opts_;
};

// One property column of a placed partition: a dense view, or a sparse index
// over that same view.
class Column
{
public:
    Column(std::string name, ColumnView view) : name_(std::move(name)), view_(view) {}
    Column(std::string name, ColumnView view, std::unique_ptr<SparseIndex> sparse)
        : name_(std::move(name)), view_(view), sparse_(std::move(sparse)) {}

    const std::string &name() const noexcept { return name_; }
    bool is_sparse() const noexcept { return sparse_ != nullptr; }

    // For sparse columns this is the dense backing; write through sparse().
    ColumnView &view() noexcept { return view_; }
    const ColumnView &view() const noexcept { return view_; }

    SparseIndex *sparse() noexcept { return sparse_.get(); }
    const SparseIndex *sparse() const noexcept { return sparse_.get(); }

    // Zero the column; sparse columns are disposed so their keys go too.
    void zero() noexcept;

private:
    std::string name_;
    ColumnView view_;
    std::unique_ptr<SparseIndex> sparse_;
};

// Placement of one partition inside the buffer. Lives until the buffer is
// cleared or destroyed.
class PartitionStorage
{
public:
    PartitionStorage(std::uint32_t byte_offset, std::uint32_t byte_length, std::vector<Column> columns)
        : byte_offset_(byte_offset), byte_length_(byte_length), columns_(std::move(columns)) {}

    PartitionStorage(const PartitionStorage &) = delete;
    PartitionStorage &operator=(const PartitionStorage &) = delete;

    std::uint32_t byte_offset() const noexcept { return byte_offset_; }
    std::uint32_t byte_length() const noexcept { return byte_length_; }

    const std::vector<Column> &columns() const noexcept { return columns_; }
    bool is_sparse() const noexcept { return !columns_.empty() && columns_.front().is_sparse(); }

    Column *find(std::string_view property) noexcept;
    const Column *find(std::string_view property) const noexcept;

    // Throw std::out_of_range for an unknown property.
    ColumnView &view(std::string_view property);
    const ColumnView &view(std::string_view property) const;

    // Throws std::out_of_range for an unknown property and TypeError for a
    // dense one.
    SparseIndex &sparse(std::string_view property);
    const SparseIndex &sparse(std::string_view property) const;

    void zero() noexcept;

private:
    std::uint32_t byte_offset_;
    std::uint32_t byte_length_;
    std::vector<Column> columns_;
};

} // namespace partbuf
