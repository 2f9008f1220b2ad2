#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <vector>

enum class Dist
{
    Uniform,
    Zipf
};

inline const char *dist_name(Dist d) { return d == Dist::Uniform ? "uniform" : "zipf"; }

// n keys drawn uniformly from [0, max_key].
inline std::vector<std::int64_t>
gen_uniform(std::size_t n, std::int64_t max_key, std::uint64_t seed = 42)
{
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<std::int64_t> d(0, max_key);
    std::vector<std::int64_t> v;
    v.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        v.push_back(d(rng));
    return v;
}

// Zipf(s) ranks over [1..universe], scattered over [0, max_key] by a fixed
// permutation so hot keys are not all small.
inline std::vector<std::int64_t>
gen_zipf(std::size_t n, std::int64_t max_key, double s = 1.2, std::uint64_t seed = 42)
{
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> U(0.0, 1.0);
    std::size_t universe = static_cast<std::size_t>(std::min<std::int64_t>(max_key + 1, 1 << 20));
    std::vector<double> cdf(universe + 1, 0.0);
    for (std::size_t k = 1; k <= universe; ++k)
        cdf[k] = cdf[k - 1] + 1.0 / std::pow((double)k, s);
    for (std::size_t k = 1; k <= universe; ++k)
        cdf[k] /= cdf[universe];

    std::vector<std::int64_t> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        double u = U(rng);
        std::size_t k = std::lower_bound(cdf.begin(), cdf.end(), u) - cdf.begin();
        out.push_back(static_cast<std::int64_t>((k * 0x9e3779b97f4a7c15ull) % std::uint64_t(max_key + 1)));
    }
    return out;
}

inline std::vector<std::int64_t>
gen_keys(Dist dist, std::size_t n, std::int64_t max_key, std::uint64_t seed)
{
    return dist == Dist::Uniform ? gen_uniform(n, max_key, seed) : gen_zipf(n, max_key, 1.2, seed);
}
