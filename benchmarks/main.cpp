#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include "workloads.hpp"

static void print_metadata(){
    std::fprintf(stderr, "# build: %s %s\n", __DATE__, __TIME__);
#if defined(__clang__)
    std::fprintf(stderr, "# compiler: clang %d\n", __clang_major__);
#elif defined(__GNUC__)
    std::fprintf(stderr, "# compiler: gcc %d\n", __GNUC__);
#endif
#ifdef NDEBUG
    std::fprintf(stderr, "# mode: Release\n");
#else
    std::fprintf(stderr, "# mode: Debug\n");
#endif
}

struct Args
{
    std::vector<std::size_t> sizes{1024, 4096, 16384, 65536, 262144, 1048576};
    int trials = 8;
    Dist dist = Dist::Uniform;
    std::uint64_t seed0 = 42;
    std::size_t owners = 4096;
    std::int64_t max_key = (1 << 20) - 1;
};

static std::vector<std::size_t> parse_list(const std::string &v)
{
    std::vector<std::size_t> out;
    std::size_t start = 0;
    while (true)
    {
        auto pos = v.find(',', start);
        std::string tok = (pos == std::string::npos) ? v.substr(start) : v.substr(start, pos - start);
        if (!tok.empty())
            out.push_back(std::stoull(tok));
        if (pos == std::string::npos)
            break;
        start = pos + 1;
    }
    return out;
}

Args parse(int argc, char **argv)
{
    Args a;
    for (int i = 1; i < argc; ++i)
    {
        std::string s = argv[i];
        std::string v;
        auto next = [&]
        { if (i+1<argc){ v = argv[++i]; } };
        if (s == "--trials")
        {
            next();
            a.trials = std::stoi(v);
        }
        else if (s == "--dist")
        {
            next();
            a.dist = (v == "zipf") ? Dist::Zipf : Dist::Uniform;
        }
        else if (s == "--seed")
        {
            next();
            a.seed0 = std::stoull(v);
        }
        else if (s == "--sizes")
        {
            next();
            a.sizes = parse_list(v);
        }
        else if (s == "--owners")
        {
            next();
            a.owners = std::stoull(v);
        }
        else if (s == "--max-key")
        {
            next();
            a.max_key = std::stoll(v);
        }
        else
        {
            std::fprintf(stderr, "unknown flag %s\n", s.c_str());
            std::exit(2);
        }
    }
    return a;
}

int main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    Args a = parse(argc, argv);
    print_metadata();
    std::fprintf(stderr, "# owners: %zu max_key: %lld\n", a.owners, (long long)a.max_key);
    print_csv_header();

    int trial = 0;
    for (int t = 0; t < a.trials; ++t)
    {
        for (auto N : a.sizes)
        {
            std::uint64_t seed = a.seed0 + t * 1315423911ull + N;
            try
            {
                print_row(run_sparse_churn(N, a.owners, a.max_key, false, a.dist, trial, seed));
                print_row(run_sparse_churn(N, a.owners, a.max_key, true, a.dist, trial, seed));
                print_row(run_sparse_stl_churn(N, a.owners, a.max_key, a.dist, trial, seed));
                print_row(run_partition_cycle(N, trial, seed));
            }
            catch (const partbuf::Error &e)
            {
                std::fprintf(stderr, "error: %s\n", e.what());
                return 1;
            }
            ++trial;
        }
    }
    return 0;
}
