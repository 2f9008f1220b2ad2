#include "partitioned_buffer.hpp"

#include <algorithm>
#include <cassert>
#include <cstring>
#include <vector>

#include "align.hpp"
#include "errors.hpp"
#include "names.hpp"

namespace partbuf
{

namespace
{

std::uint32_t checked_dimension(const char *what, std::int64_t v)
{
    if (v <= 0 || v > std::int64_t(0xffffffff))
        throw ConfigurationError(std::string(what) + " must be a positive 32-bit integer, got " +
                                 std::to_string(v));
    return static_cast<std::uint32_t>(v);
}

// Validates the constructor arguments and returns the capacity.
std::uint32_t checked_capacity(std::int64_t capacity, std::int64_t row_count)
{
    std::uint32_t c = checked_dimension("capacity", capacity);
    std::uint32_t r = checked_dimension("row_count", row_count);
    if (r < MIN_ALIGNMENT)
        throw ConfigurationError("row_count must be at least " + std::to_string(MIN_ALIGNMENT) +
                                 " to accommodate every element alignment, got " + std::to_string(r));
    if (c % r != 0)
        throw ConfigurationError("capacity " + std::to_string(c) + " must be a multiple of row_count " +
                                 std::to_string(r));
    return c;
}

// Where each property goes, relative to the partition start.
struct Layout
{
    std::vector<std::uint64_t> offsets;
    std::uint64_t total = 0;
    std::uint32_t rows = 0;
};

Layout compute_layout(const Schema &schema, std::uint32_t rows)
{
    Layout l;
    l.rows = rows;
    l.offsets.reserve(schema.size());
    std::uint64_t size = 0;
    std::uint64_t max_align = MIN_ALIGNMENT;
    for (const auto &p : schema)
    {
        std::uint32_t w = element_width(p.type);
        std::uint32_t a = element_alignment(w);
        if (!is_pow2(a))
            throw ValidationError("alignment " + std::to_string(a) + " of property '" + p.name +
                                  "' is not a power of two");
        size = align_up(size, a);
        l.offsets.push_back(size);
        size += std::uint64_t(rows) * w;
        max_align = std::max<std::uint64_t>(max_align, a);
    }
    l.total = align_up(size, max_align);
    return l;
}

} // namespace

std::byte *PartitionedBuffer::allocate_(std::uint32_t capacity)
{
    auto *p = static_cast<std::byte *>(::operator new[](capacity, std::align_val_t{STORE_ALIGNMENT}));
    std::memset(p, 0, capacity);
    return p;
}

PartitionedBuffer::PartitionedBuffer(std::int64_t capacity)
    : PartitionedBuffer(capacity, capacity)
{
}

PartitionedBuffer::PartitionedBuffer(std::int64_t capacity, std::int64_t row_count)
    : owned_(allocate_(checked_capacity(capacity, row_count))),
      data_(owned_.get()),
      capacity_(static_cast<std::uint32_t>(capacity)),
      row_count_(static_cast<std::uint32_t>(row_count)),
      cursor_(0)
{
}

PartitionedBuffer::PartitionedBuffer(std::byte *memory, std::int64_t capacity, std::int64_t row_count)
    : owned_(nullptr),
      data_(memory),
      capacity_(checked_capacity(capacity, row_count)),
      row_count_(static_cast<std::uint32_t>(row_count)),
      cursor_(0)
{
    if (!memory)
        throw ConfigurationError("backing memory must not be null");
    if (!is_aligned(memory, MIN_ALIGNMENT))
        throw ConfigurationError("backing memory must be " + std::to_string(MIN_ALIGNMENT) +
                                 "-byte aligned");
    std::memset(data_, 0, capacity_);
}

void PartitionedBuffer::validate_spec_(const Partition &spec) const
{
    const std::string &name = spec.name();
    if (!is_valid_name(name))
        throw ValidationError("invalid partition name '" + name + "'");
    if (by_name_.count(name) != 0)
        throw DuplicateNameError(name);

    const auto &max_owners = spec.max_owners();
    if (max_owners && (*max_owners <= 0 || *max_owners > SparseIndex::MAX_SAFE_KEY))
        throw ValidationError("maxOwners of partition '" + name + "' must be a positive integer, got " +
                              std::to_string(*max_owners));

    const auto &max_key = spec.max_key();
    if (max_key)
    {
        if (!max_owners)
            throw ValidationError("partition '" + name + "' sets max_key without max_owners");
        if (*max_key < 0 || *max_key > BoundedSparseIndex::MAX_BOUNDED_KEY)
            throw ValidationError("max_key of partition '" + name + "' must be in [0, " +
                                  std::to_string(BoundedSparseIndex::MAX_BOUNDED_KEY) + "], got " +
                                  std::to_string(*max_key));
    }

    spec.schema()->validate();
}

PartitionStorage *PartitionedBuffer::add_partition(const Partition &spec)
{
    if (spec.is_tag())
        return nullptr;

    auto existing = by_handle_.find(spec.handle());
    if (existing != by_handle_.end())
        return existing->second.get();

    validate_spec_(spec);

    const Schema &schema = *spec.schema();
    std::uint32_t rows = row_count_;
    if (spec.max_owners())
        rows = static_cast<std::uint32_t>(std::min<std::int64_t>(row_count_, *spec.max_owners()));

    Layout layout = compute_layout(schema, rows);
    if (layout.total > free_space())
        throw CapacityError(spec.name(), layout.total, free_space());

    // Build everything off to the side; the cursor and maps only change once
    // nothing else can fail.
    const std::uint32_t start = cursor_;
    assert(start % MIN_ALIGNMENT == 0);
    std::vector<Column> columns;
    columns.reserve(schema.size());
    std::uint64_t at = start;
    for (const auto &p : schema)
    {
        std::uint32_t w = element_width(p.type);
        at = align_up(at, element_alignment(w));
        ColumnView view(data_, static_cast<std::uint32_t>(at), rows, p.type);
        if (spec.is_sparse())
        {
            // Unused sparse slots must read as zero.
            view.fill(0.0);
            columns.emplace_back(p.name, view, make_sparse_index(view, spec.max_key()));
        }
        else
        {
            view.fill(p.initial.value_or(0.0));
            columns.emplace_back(p.name, view);
        }
        at += std::uint64_t(rows) * w;
    }
    assert(at <= start + layout.total);

    auto storage = std::make_unique<PartitionStorage>(start, static_cast<std::uint32_t>(layout.total),
                                                      std::move(columns));
    PartitionStorage *raw = storage.get();
    auto named = by_name_.emplace(spec.name(), raw).first;
    try
    {
        by_handle_.emplace(spec.handle(), std::move(storage));
    }
    catch (...)
    {
        by_name_.erase(named);
        throw;
    }
    cursor_ = start + static_cast<std::uint32_t>(layout.total);
    return raw;
}

PartitionStorage *PartitionedBuffer::get_partition(std::string_view name)
{
    auto it = by_name_.find(std::string(name));
    return it == by_name_.end() ? nullptr : it->second;
}

const PartitionStorage *PartitionedBuffer::get_partition(std::string_view name) const
{
    auto it = by_name_.find(std::string(name));
    return it == by_name_.end() ? nullptr : it->second;
}

PartitionStorage *PartitionedBuffer::get_partition(const Partition *spec)
{
    if (!spec)
        throw TypeError("partition key must not be null");
    auto it = by_handle_.find(spec->handle());
    return it == by_handle_.end() ? nullptr : it->second.get();
}

const PartitionStorage *PartitionedBuffer::get_partition(const Partition *spec) const
{
    if (!spec)
        throw TypeError("partition key must not be null");
    auto it = by_handle_.find(spec->handle());
    return it == by_handle_.end() ? nullptr : it->second.get();
}

bool PartitionedBuffer::has_partition(std::string_view name) const
{
    return by_name_.count(std::string(name)) != 0;
}

bool PartitionedBuffer::has_partition(const Partition *spec) const
{
    if (!spec)
        throw TypeError("partition key must not be null");
    return by_handle_.count(spec->handle()) != 0;
}

void PartitionedBuffer::clear() noexcept
{
    for (auto &entry : by_handle_)
        entry.second->zero();
    by_handle_.clear();
    by_name_.clear();
    cursor_ = 0;
}

} // namespace partbuf
