#include <cassert>
#include <cstdint>
#include <cstddef>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "../src/align.hpp"
#include "../src/errors.hpp"
#include "../src/partitioned_buffer.hpp"

using namespace partbuf;

static std::mt19937_64 rng(12345);

// Random key churn against std::unordered_map, for one index mode.
void check_sparse(bool bounded) {
    const std::int64_t owners = 64, max_key = 4095;
    PartitionedBuffer buf(8192, 64);
    Partition spec("churn", Schema{{"v", ElementType::Float64}},
                   PartitionOptions{owners, bounded ? std::optional<std::int64_t>(max_key) : std::nullopt});
    SparseIndex &idx = buf.add_partition(spec)->sparse("v");
    assert(idx.bounded() == bounded);

    std::unordered_map<std::int64_t, double> m;
    std::uniform_int_distribution<int> op(0, 3); // 0:set,1:erase,2:get,3:overwrite
    std::uniform_int_distribution<std::int64_t> key(0, max_key);
    for (int i=0;i<50000;++i){
        auto k = key(rng);
        int o = op(rng);
        if (o==0 || o==3){
            double v = double(rng() & 0xffffff);
            bool ok = idx.set(k, v);
            bool expect = m.count(k) || (std::int64_t)m.size() < owners;
            assert(ok==expect);
            if (ok) m[k]=v;
        } else if (o==1){
            bool e1 = idx.erase(k);
            std::size_t e2 = m.erase(k);
            assert(e1==(e2==1));
        } else {
            auto r = idx.get(k);
            auto it = m.find(k);
            if (r.has_value()) { assert(it!=m.end()); assert(*r==it->second); }
            else { assert(it==m.end()); }
        }
        assert(idx.size()==m.size());
    }
    double sum = 0, expect_sum = 0;
    idx.for_each([&](std::int64_t k, double v){ assert(m.at(k)==v); sum += v; });
    for (auto &kv : m) expect_sum += kv.second;
    assert(sum==expect_sum);

    idx.erase(SparseIndex::DISPOSE_KEY);
    assert(idx.empty());
    for (std::uint32_t r=0;r<idx.dense().length();++r) assert(idx.dense().get(r)==0);
}

// Random add/clear cycles; the cursor must match a simple running total
// and every placement must stay aligned and disjoint.
void check_allocator() {
    const ElementType types[] = {ElementType::Int8, ElementType::Uint8, ElementType::Uint8Clamped,
                                 ElementType::Int16, ElementType::Uint16, ElementType::Int32,
                                 ElementType::Uint32, ElementType::Float32, ElementType::Float64};
    std::uniform_int_distribution<int> pick(0, 8), props(1, 5), action(0, 19);
    const std::uint32_t rows = 32, cap = rows * 512;
    PartitionedBuffer buf(cap, rows);

    std::vector<Partition> specs;
    for (int i=0;i<200;++i){
        Schema s;
        int n = props(rng);
        for (int j=0;j<n;++j) s.add("p"+std::to_string(j), types[pick(rng)]);
        specs.emplace_back("part"+std::to_string(i), s);
    }

    std::uint64_t model = 0;
    std::uint32_t prev_end = 0;
    std::size_t placed = 0;
    for (auto &spec : specs){
        if (action(rng)==0){
            buf.clear();
            model = 0; prev_end = 0; placed = 0;
            for (std::uint32_t b=0;b<cap;++b) assert(std::to_integer<int>(buf.data()[b])==0);
            continue;
        }
        std::uint64_t need = 0, max_align = MIN_ALIGNMENT;
        for (auto &p : *spec.schema()){
            std::uint32_t w = element_width(p.type);
            need = align_up(need, element_alignment(w)) + std::uint64_t(rows) * w;
            if (element_alignment(w) > max_align) max_align = element_alignment(w);
        }
        need = align_up(need, max_align);
        try {
            auto *st = buf.add_partition(spec);
            assert(model + need <= cap);
            assert(st->byte_offset()==model);
            assert(st->byte_offset()>=prev_end);
            assert(st->byte_length()==need);
            for (auto &c : st->columns())
                assert(c.view().byte_offset() % element_alignment(c.view().width())==0);
            model += need;
            prev_end = st->byte_offset() + st->byte_length();
            ++placed;
        } catch (const CapacityError &e) {
            assert(model + need > cap);
            assert(e.required()==need);
            assert(e.available()==cap - model);
        }
        assert(buf.offset()==model);
        assert(buf.offset() + buf.free_space()==buf.capacity());
        assert(buf.partition_count()==placed);
    }
}

int main(){
    check_sparse(false);
    check_sparse(true);
    check_allocator();
    std::cout << "OK\n";
    return 0;
}
