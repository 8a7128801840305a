#include <benchmark/benchmark.h>

#include <cstdio>
#include <string>
#include <vector>

#include "merklegate/address.hpp"
#include "merklegate/commitment.hpp"
#include "merklegate/keccak.hpp"
#include "merklegate/leaf_hasher.hpp"
#include "merklegate/merkle_tree.hpp"
#include "merklegate/record_parser.hpp"

using namespace merklegate;

namespace {

std::vector<Address> make_addresses(size_t n) {
    std::vector<Address> out;
    out.reserve(n);
    char buf[43];
    for (size_t i = 0; i < n; ++i) {
        std::snprintf(buf, sizeof(buf), "0x%040zx", i + 1);
        out.push_back(*Address::parse(buf));
    }
    return out;
}

std::string make_csv(size_t n) {
    std::string text = "address\n";
    char buf[64];
    for (size_t i = 0; i < n; ++i) {
        std::snprintf(buf, sizeof(buf), "0x%040zx\n", i + 1);
        text += buf;
    }
    return text;
}

} // anonymous namespace

static void BM_Keccak256(benchmark::State& state) {
    std::string data(state.range(0), 'a');
    for (auto _ : state) {
        benchmark::DoNotOptimize(Keccak256Hasher::hash(std::string_view(data)));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Keccak256)->RangeMultiplier(4)->Range(20, 4096);

static void BM_AddressChecksum(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(Address::parse("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"));
    }
}
BENCHMARK(BM_AddressChecksum);

static void BM_HashLeaves(benchmark::State& state) {
    auto addresses = make_addresses(static_cast<size_t>(state.range(0)));
    const size_t threads = static_cast<size_t>(state.range(1));
    for (auto _ : state) {
        benchmark::DoNotOptimize(hash_leaves(addresses, threads));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_HashLeaves)->Args({10000, 1})->Args({10000, 4})->Args({100000, 1})->Args({100000, 4})
    ->Unit(benchmark::kMillisecond);

static void BM_TreeBuild(benchmark::State& state) {
    auto leaves = hash_leaves(make_addresses(static_cast<size_t>(state.range(0))));
    for (auto _ : state) {
        benchmark::DoNotOptimize(MerkleTree::build(leaves).root());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_TreeBuild)->RangeMultiplier(10)->Range(100, 100000)->Unit(benchmark::kMicrosecond);

static void BM_CommitmentPipeline(benchmark::State& state) {
    std::string text = make_csv(static_cast<size_t>(state.range(0)));
    CsvRecordAdapter adapter;
    CommitmentBuilder builder;
    for (auto _ : state) {
        benchmark::DoNotOptimize(builder.build(text, adapter).root);
    }
}
BENCHMARK(BM_CommitmentPipeline)->Arg(1000)->Arg(10000)->Unit(benchmark::kMillisecond);
