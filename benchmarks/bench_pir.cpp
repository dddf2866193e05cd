#include <benchmark/benchmark.h>
#include "ghostpir/algebra/z256.hpp"
#include "ghostpir/network/message.hpp"
#include "ghostpir/pir/reconstructor.hpp"
#include "ghostpir/pir/vector_generator.hpp"
#include <random>

using namespace ghostpir;
using namespace ghostpir::algebra;
using namespace ghostpir::pir;

namespace {

std::vector<uint8_t> make_matrix(size_t n, size_t row_len) {
    std::mt19937 rng(1234);
    std::vector<uint8_t> m(n * row_len);
    for (auto& b : m) {
        b = static_cast<uint8_t>(rng());
    }
    return m;
}

} // anonymous namespace

// ============================================================================
// Query Generation
// ============================================================================

static void BM_VectorGeneration(benchmark::State& state) {
    size_t n = state.range(0);
    VectorGenerator gen;

    for (auto _ : state) {
        auto set = gen.generate(n / 2, n);
        benchmark::DoNotOptimize(set);
    }

    state.SetItemsProcessed(state.iterations() * n * kShareCount);
}
BENCHMARK(BM_VectorGeneration)->Range(16, 1 << 16);

static void BM_KpirRequestEncode(benchmark::State& state) {
    size_t n = state.range(0);
    VectorGenerator gen;
    auto set = gen.generate(0, n);

    for (auto _ : state) {
        auto json = network::KpirRequestMessage("token", set, 0).to_json();
        benchmark::DoNotOptimize(json);
    }
}
BENCHMARK(BM_KpirRequestEncode)->Range(16, 4096);

// ============================================================================
// Reconstruction
// ============================================================================

static void BM_Reconstruction(benchmark::State& state) {
    size_t chunk_size = state.range(0);
    Reconstructor rec(chunk_size);

    ChunkResponse response;
    auto bytes = make_matrix(kShareCount, chunk_size);
    for (size_t k = 0; k < kShareCount; ++k) {
        response.shares[k] = ShareVector(std::vector<uint8_t>(
            bytes.begin() + k * chunk_size, bytes.begin() + (k + 1) * chunk_size));
    }

    for (auto _ : state) {
        auto plaintext = rec.recover(response);
        benchmark::DoNotOptimize(plaintext);
    }

    state.SetBytesProcessed(state.iterations() * chunk_size * kShareCount);
}
BENCHMARK(BM_Reconstruction)->Range(256, 1 << 16);

// ============================================================================
// Simulated Round Trip
// ============================================================================

/// Client shares -> three responder products -> reconstruction, per chunk
static void BM_SimulatedChunkRoundTrip(benchmark::State& state) {
    size_t n = state.range(0);
    const size_t chunk_size = kDefaultChunkSize;
    auto matrix = make_matrix(n, chunk_size);

    VectorGenerator gen;
    Reconstructor rec(chunk_size);

    for (auto _ : state) {
        auto set = gen.generate(n - 1, n);

        ChunkResponse response;
        for (size_t k = 0; k < kShareCount; ++k) {
            response.shares[k] = ShareVector(select_rows(set[k].bytes(), matrix, n, chunk_size));
        }

        auto plaintext = rec.recover(response);
        benchmark::DoNotOptimize(plaintext);
    }

    state.SetBytesProcessed(state.iterations() * n * chunk_size * kShareCount);
}
BENCHMARK(BM_SimulatedChunkRoundTrip)->RangeMultiplier(4)->Range(4, 256);

BENCHMARK_MAIN();
