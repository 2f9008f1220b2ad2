#include "partition.hpp"

#include <atomic>
#include <stdexcept>

#include "errors.hpp"

namespace partbuf
{

namespace
{

PartitionHandle next_handle() noexcept
{
    static std::atomic<PartitionHandle> counter{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace

Partition::Partition(std::string name)
    : handle_(next_handle()), name_(std::move(name))
{
}

Partition::Partition(std::string name, Schema schema, PartitionOptions opts)
    : handle_(next_handle()), name_(std::move(name)), schema_(std::move(schema)), opts_(opts)
{
}

void Column::zero() noexcept
{
    if (sparse_)
        sparse_->dispose();
    else
        view_.fill(0.0);
}

Column *PartitionStorage::find(std::string_view property) noexcept
{
    for (auto &c : columns_)
        if (c.name() == property)
            return &c;
    return nullptr;
}

const Column *PartitionStorage::find(std::string_view property) const noexcept
{
    for (const auto &c : columns_)
        if (c.name() == property)
            return &c;
    return nullptr;
}

ColumnView &PartitionStorage::view(std::string_view property)
{
    Column *c = find(property);
    if (!c)
        throw std::out_of_range("no property '" + std::string(property) + "' in partition");
    return c->view();
}

const ColumnView &PartitionStorage::view(std::string_view property) const
{
    const Column *c = find(property);
    if (!c)
        throw std::out_of_range("no property '" + std::string(property) + "' in partition");
    return c->view();
}

SparseIndex &PartitionStorage::sparse(std::string_view property)
{
    Column *c = find(property);
    if (!c)
        throw std::out_of_range("no property '" + std::string(property) + "' in partition");
    if (!c->is_sparse())
        throw TypeError("property '" + std::string(property) + "' is dense");
    return *c->sparse();
}

const SparseIndex &PartitionStorage::sparse(std::string_view property) const
{
    const Column *c = find(property);
    if (!c)
        throw std::out_of_range("no property '" + std::string(property) + "' in partition");
    if (!c->is_sparse())
        throw TypeError("property '" + std::string(property) + "' is dense");
    return *c->sparse();
}

void PartitionStorage::zero() noexcept
{
    for (auto &c : columns_)
        c.zero();
}

} // namespace partbuf
