#include <benchmark/benchmark.h>
#include <cstdint>
#include <map>
#include <vector>
#include "splicer/core/splice.h"

using namespace splicer;

/**
 * 벤치마크용 입력 데이터 캐시
 * 크기별로 한 번만 생성합니다 (바이트 값 = 위치 % 256).
 */
class BenchmarkData {
public:
    static BenchmarkData& getInstance() {
        static BenchmarkData instance;
        return instance;
    }

    const std::vector<uint8_t>& getInput(size_t size) {
        auto it = inputs_.find(size);
        if (it == inputs_.end()) {
            std::vector<uint8_t> input(size);
            for (size_t i = 0; i < size; ++i) {
                input[i] = static_cast<uint8_t>(i);
            }
            it = inputs_.emplace(size, std::move(input)).first;
        }
        return it->second;
    }

private:
    BenchmarkData() = default;

    std::map<size_t, std::vector<uint8_t>> inputs_;
};

// 처리량 벤치마크의 채널 수
constexpr size_t kThroughputChannels = 5;

// 스모크 비교용 고정 입력과 채널 수
constexpr size_t kSimpleChannels = 4;
static const std::vector<uint8_t> kSimpleInput = {0, 1, 2, 3, 4, 5, 6};

static void RunThroughput(benchmark::State& state, SpliceStrategy strategy) {
    const size_t n = static_cast<size_t>(state.range(0));
    const auto& input = BenchmarkData::getInstance().getInput(n);
    const base::Span<const uint8_t> span(input.data(), input.size());

    for (auto _ : state) {
        Channels out = splice(strategy, kThroughputChannels, span);
        benchmark::DoNotOptimize(out.data());
        benchmark::ClobberMemory();
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(n));
    state.SetLabel(strategy_name(strategy));
}

//==============================================================================
// 고정 7개 원소 입력 (채널 4)
//==============================================================================

static void BM_Simple_Direct(benchmark::State& state) {
    for (auto _ : state) {
        Channels out = splice_direct(kSimpleChannels, kSimpleInput);
        benchmark::DoNotOptimize(out.data());
    }
}

static void BM_Simple_Strided(benchmark::State& state) {
    for (auto _ : state) {
        Channels out = splice_strided(kSimpleChannels, kSimpleInput);
        benchmark::DoNotOptimize(out.data());
    }
}

static void BM_Simple_StridedParallel(benchmark::State& state) {
    for (auto _ : state) {
        Channels out = splice_strided_parallel(kSimpleChannels, kSimpleInput);
        benchmark::DoNotOptimize(out.data());
    }
}

static void BM_Simple_Simd(benchmark::State& state) {
    for (auto _ : state) {
        Channels out = splice_simd(kSimpleChannels, kSimpleInput);
        benchmark::DoNotOptimize(out.data());
    }
}

//==============================================================================
// 처리량 벤치마크 (채널 5)
//==============================================================================

static void BM_Throughput_Direct(benchmark::State& state) {
    RunThroughput(state, SpliceStrategy::DIRECT);
}

static void BM_Throughput_Strided(benchmark::State& state) {
    RunThroughput(state, SpliceStrategy::STRIDED);
}

static void BM_Throughput_StridedParallel(benchmark::State& state) {
    RunThroughput(state, SpliceStrategy::STRIDED_PARALLEL);
}

static void BM_Throughput_Simd(benchmark::State& state) {
    RunThroughput(state, SpliceStrategy::SIMD);
}

// SIMD 경로를 실제로 타는 채널 4 비교
static void BM_Throughput4_Direct(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    const auto& input = BenchmarkData::getInstance().getInput(n);

    for (auto _ : state) {
        Channels out = splice_direct(4, input);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}

static void BM_Throughput4_Simd(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    const auto& input = BenchmarkData::getInstance().getInput(n);

    for (auto _ : state) {
        Channels out = splice_simd(4, input);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}

//==============================================================================
// 벤치마크 등록
//==============================================================================

// 큰 입력: 1 ~ 2^26 (64MB)
static void LargeSizes(benchmark::internal::Benchmark* b) {
    b->RangeMultiplier(2)->Range(1, 1 << 26);
}

// 작은 입력: 1 ~ 2^10 (1KB), 병렬 오버헤드가 지배하는 구간
static void SmallSizes(benchmark::internal::Benchmark* b) {
    b->RangeMultiplier(2)->Range(1, 1 << 10);
}

BENCHMARK(BM_Simple_Direct);
BENCHMARK(BM_Simple_Strided);
BENCHMARK(BM_Simple_StridedParallel);
BENCHMARK(BM_Simple_Simd);

BENCHMARK(BM_Throughput_Direct)->Apply(LargeSizes)->UseRealTime();
BENCHMARK(BM_Throughput_Strided)->Apply(LargeSizes)->UseRealTime();
BENCHMARK(BM_Throughput_StridedParallel)->Apply(LargeSizes)->UseRealTime();
BENCHMARK(BM_Throughput_Simd)->Apply(LargeSizes)->UseRealTime();

BENCHMARK(BM_Throughput_Direct)->Name("BM_ThroughputSmall_Direct")->Apply(SmallSizes);
BENCHMARK(BM_Throughput_Strided)->Name("BM_ThroughputSmall_Strided")->Apply(SmallSizes);

BENCHMARK(BM_Throughput4_Direct)->Apply(LargeSizes)->UseRealTime();
BENCHMARK(BM_Throughput4_Simd)->Apply(LargeSizes)->UseRealTime();

BENCHMARK_MAIN();
