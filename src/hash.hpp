#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace partbuf
{

// Open-addressing key -> slot map with linear probing.
// Tombstones count towards the load factor so that long insert/erase churn
// rehashes (and purges them) instead of degrading into full-table probes.
class KeySlotMap
{
public:
    using Key = std::uint64_t;
    using Slot = std::uint32_t;

    explicit KeySlotMap(std::size_t expected = 8, double max_load = 0.7)
        : max_load_(max_load), sz_(0), tombs_(0)
    {
        reserve_(static_cast<std::size_t>(expected / max_load_) + 1);
    }

    // Keeps the table allocation.
    void clear()
    {
        table_.assign(table_.size(), Entry{});
        sz_ = 0;
        tombs_ = 0;
    }

    std::size_t size() const { return sz_; }
    std::size_t capacity() const { return table_.size(); }
    bool empty() const { return sz_ == 0; }

    // Returns true if key was new, false if an existing mapping was overwritten.
    bool insert(Key k, Slot s)
    {
        if ((double)(sz_ + tombs_ + 1) / capacity() > max_load_)
            rehash_((double)(sz_ + 1) / capacity() > max_load_ / 2 ? capacity() * 2 : capacity());
        return insert_no_resize_(k, s);
    }

    std::optional<Slot> find(Key k) const
    {
        std::size_t mask = capacity() - 1;
        std::size_t i = hash_(k) & mask;
        for (std::size_t probes = 0; probes < capacity(); ++probes, i = (i + 1) & mask)
        {
            const Entry &e = table_[i];
            if (e.state == State::Empty)
                return std::nullopt;
            if (e.state == State::Full && e.k == k)
                return e.s;
        }
        return std::nullopt;
    }

    bool contains(Key k) const { return find(k).has_value(); }

    bool erase(Key k)
    {
        std::size_t mask = capacity() - 1;
        std::size_t i = hash_(k) & mask;
        for (std::size_t probes = 0; probes < capacity(); ++probes, i = (i + 1) & mask)
        {
            Entry &e = table_[i];
            if (e.state == State::Empty)
                return false;
            if (e.state == State::Full && e.k == k)
            {
                e.state = State::Tomb;
                --sz_;
                ++tombs_;
                return true;
            }
        }
        return false;
    }

    template <typename F>
    void for_each(F &&f) const
    {
        for (const Entry &e : table_)
            if (e.state == State::Full)
                f(e.k, e.s);
    }

private:
    enum class State : std::uint8_t
    {
        Empty,
        Full,
        Tomb
    };

    struct Entry
    {
        Key k = 0;
        Slot s = 0;
        State state = State::Empty;
    };

    static std::uint64_t hash_(std::uint64_t x)
    {
        // splitmix64 finalizer
        x += 0x9e3779b97f4a7c15ull;
        x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
        x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
        x = x ^ (x >> 31);
        return x;
    }

    bool insert_no_resize_(Key k, Slot s)
    {
        std::size_t mask = capacity() - 1;
        std::size_t i = hash_(k) & mask;
        std::size_t first_tomb = capacity();
        for (std::size_t probes = 0; probes < capacity(); ++probes, i = (i + 1) & mask)
        {
            Entry &e = table_[i];
            if (e.state == State::Full)
            {
                if (e.k == k)
                {
                    e.s = s;
                    return false;
                }
            }
            else if (e.state == State::Tomb)
            {
                if (first_tomb == capacity())
                    first_tomb = i;
            }
            else
            {
                if (first_tomb != capacity())
                {
                    table_[first_tomb] = Entry{k, s, State::Full};
                    --tombs_;
                }
                else
                {
                    e = Entry{k, s, State::Full};
                }
                ++sz_;
                return true;
            }
        }
        // Only tombstones left on the probe path; reuse the first one.
        if (first_tomb != capacity())
        {
            table_[first_tomb] = Entry{k, s, State::Full};
            --tombs_;
            ++sz_;
            return true;
        }
        return false;
    }

    void reserve_(std::size_t n)
    {
        std::size_t cap = 8;
        while (cap < n)
            cap <<= 1; // power of two capacity
        table_.assign(cap, Entry{});
    }

    void rehash_(std::size_t n)
    {
        std::vector<Entry> old = std::move(table_);
        reserve_(n);
        sz_ = 0;
        tombs_ = 0;
        for (const Entry &e : old)
            if (e.state == State::Full)
                insert_no_resize_(e.k, e.s);
    }

    double max_load_;
    std::size_t sz_;
    std::size_t tombs_;
    std::vector<Entry> table_;
};

} // namespace partbuf
