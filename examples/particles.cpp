#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "errors.hpp"
#include "partitioned_buffer.hpp"

using namespace partbuf;

// A tiny particle system: dense position and velocity columns for every row,
// a sparse "heat" column that only burning particles own.

struct Args
{
    std::int64_t capacity = 1 << 16;
    std::int64_t rows = 1024;
    std::int64_t owners = 64;
    int steps = 100;
    std::uint64_t seed = 42;
};

Args parse(int argc, char **argv)
{
    Args a;
    for (int i = 1; i < argc; ++i)
    {
        std::string s = argv[i];
        std::string v;
        auto next = [&]
        { if (i+1<argc){ v = argv[++i]; } };
        if (s == "--capacity")
        {
            next();
            a.capacity = std::stoll(v);
        }
        else if (s == "--rows")
        {
            next();
            a.rows = std::stoll(v);
        }
        else if (s == "--owners")
        {
            next();
            a.owners = std::stoll(v);
        }
        else if (s == "--steps" || s == "--trials")
        {
            next();
            a.steps = std::stoi(v);
        }
        else if (s == "--seed")
        {
            next();
            a.seed = std::stoull(v);
        }
        else
        {
            std::fprintf(stderr, "unknown flag %s\n", s.c_str());
            std::exit(2);
        }
    }
    return a;
}

int run(const Args &a)
{
    PartitionedBuffer buf(a.capacity, a.rows);
    std::fprintf(stderr, "# capacity: %u rows: %u\n", buf.capacity(), buf.row_count());

    Partition alive("isAlive");
    Partition position("position", Schema{{"x", ElementType::Float32}, {"y", ElementType::Float32}});
    Partition velocity("velocity", Schema{{"x", ElementType::Float32}, {"y", ElementType::Float32, -1.0}});
    Partition heat("heat", Schema{{"t", ElementType::Uint8Clamped}}, PartitionOptions{a.owners, a.rows - 1});

    buf.add_partition(alive); // tags take no space
    PartitionStorage &pos = *buf.add_partition(position);
    PartitionStorage &vel = *buf.add_partition(velocity);
    SparseIndex &burning = buf.add_partition(heat)->sparse("t");

    std::cout << "placed " << buf.partition_count() << " partitions, " << buf.offset() << " of "
              << buf.capacity() << " bytes used\n";

    std::mt19937_64 rng(a.seed);
    std::uniform_real_distribution<float> U(-1.0f, 1.0f);
    std::uniform_int_distribution<std::int64_t> pick(0, a.rows - 1);

    float *px = pos.view("x").as<float>();
    float *py = pos.view("y").as<float>();
    float *vx = vel.view("x").as<float>();
    float *vy = vel.view("y").as<float>();
    const std::uint32_t n = buf.row_count();
    for (std::uint32_t i = 0; i < n; ++i)
    {
        px[i] = U(rng) * 100.0f;
        py[i] = U(rng) * 100.0f;
        vx[i] = U(rng);
    }

    std::uint64_t ignited = 0, refused = 0;
    for (int step = 1; step <= a.steps; ++step)
    {
        for (std::uint32_t i = 0; i < n; ++i)
        {
            px[i] += vx[i];
            py[i] += vy[i];
            if (py[i] < -100.0f)
            {
                py[i] = 100.0f;
                vy[i] = -1.0f;
            }
        }

        // Ignite a few random particles; cool the burning ones.
        for (int k = 0; k < 4; ++k)
        {
            if (burning.set(pick(rng), 255))
                ++ignited;
            else
                ++refused;
        }
        std::vector<std::int64_t> cooled;
        burning.for_each([&](std::int64_t id, double t)
                         {
            if (t <= 16) cooled.push_back(id);
            else burning.set(id, t - 16); });
        for (auto id : cooled)
            burning.erase(id);

        if (step % 10 == 0 || step == a.steps)
            std::cout << "step " << step << ": " << burning.size() << "/" << burning.capacity()
                      << " burning, particle 0 at (" << px[0] << ", " << py[0] << ")\n";
    }
    std::cout << "ignited " << ignited << ", refused " << refused << " (pool full)\n";

    buf.clear();
    std::cout << "cleared, " << buf.free_space() << " bytes free\n";
    return 0;
}

int main(int argc, char **argv)
{
    Args a = parse(argc, argv);
    try
    {
        return run(a);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }
}
