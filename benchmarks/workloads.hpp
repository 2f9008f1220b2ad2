#pragma once
#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "datasets.hpp"
#include "../src/errors.hpp"
#include "../src/partitioned_buffer.hpp"

// Minimal checksum sink to prevent dead-code elimination.
struct Sink
{
    volatile std::uint64_t acc = 0;
    void eat(std::uint64_t x) { acc ^= x + 0x9e3779b97f4a7c15ull + (acc << 6) + (acc >> 2); }
};

template <class F>
std::uint64_t time_ns(F &&f)
{
    auto t0 = std::chrono::high_resolution_clock::now();
    f();
    auto t1 = std::chrono::high_resolution_clock::now();
    return (std::uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
}

struct Row
{
    std::string ds, impl, workload, dist, params;
    std::size_t N;
    int trial;
    std::uint64_t seed, ns;
    std::uint64_t checksum;
};

inline void print_csv_header()
{
    std::cout << "ds,impl,workload,N,dist,params,trial,seed,ns,checksum\n";
}

inline void print_row(const Row &r)
{
    std::cout << r.ds << "," << r.impl << "," << r.workload << "," << r.N << "," << r.dist << ","
              << r.params << "," << r.trial << "," << r.seed << "," << r.ns << "," << r.checksum << "\n";
}

// Row count of a buffer large enough for `owners` float64 slots.
inline std::int64_t rows_for(std::size_t owners)
{
    std::int64_t rows = 8;
    while (rows < (std::int64_t)owners)
        rows *= 2;
    return rows;
}

// ---- Workloads ----

// Sparse column: N operations, set if absent else erase, then a mixed lookup pass.
inline Row run_sparse_churn(std::size_t N, std::size_t owners, std::int64_t max_key, bool bounded,
                            Dist dist, int trial, std::uint64_t seed)
{
    using namespace partbuf;
    Sink s;
    std::int64_t rows = rows_for(owners);
    PartitionedBuffer buf(rows * 8, rows);
    Partition spec("value", Schema{{"v", ElementType::Float64}},
                   PartitionOptions{(std::int64_t)owners,
                                    bounded ? std::optional<std::int64_t>(max_key) : std::nullopt});
    SparseIndex &idx = buf.add_partition(spec)->sparse("v");
    auto keys = gen_keys(dist, N, max_key, seed);

    std::uint64_t ns = time_ns([&]
                               {
        for (auto k : keys)
        {
            if (idx.contains(k))
                idx.erase(k);
            else
                s.eat(idx.set(k, double(k & 0xffff)));
        }
        for (std::size_t i = 0; i < N; ++i)
        {
            auto r = idx.get((i % 2 == 0) ? keys[i] : max_key - keys[i]);
            s.eat(r ? (std::uint64_t)*r : 0x1234ULL);
        } });

    Row r{"sparse", bounded ? "bounded" : "hashed", "toggle+mixed_get", dist_name(dist),
          "owners=" + std::to_string(owners) + ";max_key=" + std::to_string(max_key),
          N, trial, seed, ns, s.acc};
    return r;
}

// Same workload against std::unordered_map with the same owner cap.
inline Row run_sparse_stl_churn(std::size_t N, std::size_t owners, std::int64_t max_key,
                                Dist dist, int trial, std::uint64_t seed)
{
    Sink s;
    std::unordered_map<std::int64_t, double> m;
    auto keys = gen_keys(dist, N, max_key, seed);

    std::uint64_t ns = time_ns([&]
                               {
        for (auto k : keys)
        {
            auto it = m.find(k);
            if (it != m.end())
                m.erase(it);
            else if (m.size() < owners)
            {
                m.emplace(k, double(k & 0xffff));
                s.eat(1);
            }
            else
                s.eat(0);
        }
        for (std::size_t i = 0; i < N; ++i)
        {
            auto it = m.find((i % 2 == 0) ? keys[i] : max_key - keys[i]);
            s.eat(it != m.end() ? (std::uint64_t)it->second : 0x1234ULL);
        } });

    Row r{"sparse", "stl", "toggle+mixed_get", dist_name(dist),
          "owners=" + std::to_string(owners) + ";max_key=" + std::to_string(max_key),
          N, trial, seed, ns, s.acc};
    return r;
}

// N partitions of a fixed 3-column schema added until full, then cleared; repeated.
inline Row run_partition_cycle(std::size_t N, int trial, std::uint64_t seed)
{
    using namespace partbuf;
    Sink s;
    const std::int64_t rows = 64;
    std::vector<Partition> specs;
    specs.reserve(N);
    for (std::size_t i = 0; i < N; ++i)
        specs.emplace_back("p" + std::to_string(i),
                           Schema{{"x", ElementType::Float32}, {"y", ElementType::Float32},
                                  {"flags", ElementType::Uint8}});
    // x, y, flags: 256 + 256 + 64 bytes
    const std::int64_t per = 576;
    PartitionedBuffer buf(rows * ((per * 64 + rows - 1) / rows), rows);

    std::uint64_t ns = time_ns([&]
                               {
        for (std::size_t i = 0; i < N; ++i)
        {
            try
            {
                s.eat(buf.add_partition(specs[i])->byte_offset());
            }
            catch (const CapacityError &)
            {
                buf.clear();
                s.eat(buf.add_partition(specs[i])->byte_offset());
            }
        } });

    Row r{"arena", "partbuf", "add_partition+clear", "n/a", "rows=64;props=3",
          N, trial, seed, ns, s.acc};
    return r;
}
