#include <gtest/gtest.h>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <vector>

#include "splicer/core/splice.h"
#include "splice_oracle.h"

using namespace splicer;
using namespace splicer::oracle;

using SpliceFn = std::function<Channels(size_t, base::Span<const uint8_t>)>;

class SpliceTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 입력 길이와 채널 수 조합: 채널 수가 길이보다 큰 경우 포함
        lengths_ = {0, 1, 2, 3, 7, 8, 15, 16, 17, 31, 32, 33, 63, 64, 65, 127, 255, 1000, 4099};
        channel_counts_ = {1, 2, 3, 4, 5, 6, 7, 8, 13, 64, 300};
    }

    // 고정 8개 원소 표와 비교
    void CheckEightElementTable(const SpliceFn& fn, const char* name) {
        const auto input = EightElementInput();
        const auto table = EightElementTable();
        for (size_t channels = 1; channels < table.size(); ++channels) {
            EXPECT_EQ(fn(channels, input), table[channels])
                << name << "(" << channels << ", [0..7])";
        }
    }

    // 참조 구현과 비교
    void CheckAgainstReference(const SpliceFn& fn, const char* name) {
        for (size_t len : lengths_) {
            const auto input = RandomBytes(len, static_cast<uint32_t>(len));
            for (size_t channels : channel_counts_) {
                EXPECT_EQ(fn(channels, input), ReferenceSplice(channels, input))
                    << name << " len=" << len << " channels=" << channels;
            }
        }
    }

    std::vector<size_t> lengths_;
    std::vector<size_t> channel_counts_;
};

//==============================================================================
// 고정 8개 원소 표
//==============================================================================

TEST_F(SpliceTest, DirectEightElementTable) {
    CheckEightElementTable(splice_direct, "splice_direct");
}

TEST_F(SpliceTest, StridedEightElementTable) {
    CheckEightElementTable(splice_strided, "splice_strided");
}

TEST_F(SpliceTest, StridedParallelEightElementTable) {
    CheckEightElementTable(splice_strided_parallel, "splice_strided_parallel");
}

TEST_F(SpliceTest, SimdEightElementTable) {
    CheckEightElementTable(splice_simd, "splice_simd");
}

//==============================================================================
// 참조 구현 비교
//==============================================================================

TEST_F(SpliceTest, DirectMatchesReference) {
    CheckAgainstReference(splice_direct, "splice_direct");
}

TEST_F(SpliceTest, StridedMatchesReference) {
    CheckAgainstReference(splice_strided, "splice_strided");
}

TEST_F(SpliceTest, StridedParallelMatchesReference) {
    CheckAgainstReference(splice_strided_parallel, "splice_strided_parallel");
}

TEST_F(SpliceTest, SimdMatchesReference) {
    CheckAgainstReference(splice_simd, "splice_simd");
}

// 모든 전략이 같은 결과를 내는지 (디스패치 경유)
TEST_F(SpliceTest, AllStrategiesEquivalent) {
    for (size_t len : lengths_) {
        const auto input = RandomBytes(len, 777u + static_cast<uint32_t>(len));
        for (size_t channels : channel_counts_) {
            const Channels expected = splice_direct(channels, input);
            for (SpliceStrategy strategy : all_strategies()) {
                EXPECT_EQ(splice(strategy, channels, input), expected)
                    << strategy_name(strategy) << " len=" << len << " channels=" << channels;
            }
        }
    }
}

// SIMD 경로의 벡터 경계 근처 (여러 벡터 + 꼬리)
TEST_F(SpliceTest, SimdVectorBoundaries) {
    for (size_t channels = 2; channels <= kMaxSimdChannels; ++channels) {
        for (size_t frames : {15u, 16u, 17u, 31u, 32u, 33u, 63u, 64u, 65u, 128u, 129u, 257u}) {
            for (size_t extra = 0; extra < channels; ++extra) {
                const auto input = RandomBytes(frames * channels + extra, static_cast<uint32_t>(frames));
                EXPECT_EQ(splice_simd(channels, input), ReferenceSplice(channels, input))
                    << "channels=" << channels << " frames=" << frames << " extra=" << extra;
            }
        }
    }
}

//==============================================================================
// 크기 규칙과 분할 완전성
//==============================================================================

TEST_F(SpliceTest, SizeLaw) {
    for (size_t len : lengths_) {
        const auto input = RandomBytes(len);
        for (size_t channels : channel_counts_) {
            for (SpliceStrategy strategy : all_strategies()) {
                const Channels out = splice(strategy, channels, input);
                ASSERT_EQ(out.size(), channels);

                const size_t base = len / channels;
                const size_t extra = len % channels;
                for (size_t i = 0; i < channels; ++i) {
                    const size_t expected = (i < len) ? (len - i + channels - 1) / channels : 0;
                    EXPECT_EQ(out[i].size(), expected);
                    EXPECT_EQ(out[i].size(), base + (i < extra ? 1 : 0));
                }
            }
        }
    }
}

TEST_F(SpliceTest, PartitionCompleteness) {
    for (size_t len : lengths_) {
        const auto input = RandomBytes(len, 99u);
        for (size_t channels : channel_counts_) {
            for (SpliceStrategy strategy : all_strategies()) {
                EXPECT_EQ(interleave(splice(strategy, channels, input)), input)
                    << strategy_name(strategy) << " len=" << len << " channels=" << channels;
            }
        }
    }
}

TEST_F(SpliceTest, EmptyInputYieldsEmptyChannels) {
    const std::vector<uint8_t> empty;
    for (size_t channels : channel_counts_) {
        for (SpliceStrategy strategy : all_strategies()) {
            const Channels out = splice(strategy, channels, empty);
            ASSERT_EQ(out.size(), channels);
            for (const auto& ch : out) {
                EXPECT_TRUE(ch.empty());
            }
        }
    }
}

TEST_F(SpliceTest, MoreChannelsThanElements) {
    const std::vector<uint8_t> input = {9, 8, 7};
    const Channels expected = {{9}, {8}, {7}, {}, {}};
    for (SpliceStrategy strategy : all_strategies()) {
        EXPECT_EQ(splice(strategy, 5, input), expected) << strategy_name(strategy);
    }
}

// 출력은 입력과 별도로 할당됨
TEST_F(SpliceTest, OutputDoesNotAliasInput) {
    std::vector<uint8_t> input = {1, 2, 3, 4};
    const Channels out = splice_direct(2, input);
    input[0] = 100;
    EXPECT_EQ(out[0][0], 1);
    EXPECT_EQ(input, (std::vector<uint8_t>{100, 2, 3, 4}));
}

//==============================================================================
// 전제조건: 채널 수 0
//==============================================================================

TEST_F(SpliceTest, ZeroChannelsThrows) {
    const auto input = EightElementInput();
    EXPECT_THROW(splice_direct(0, input), InvalidChannelCount);
    EXPECT_THROW(splice_strided(0, input), InvalidChannelCount);
    EXPECT_THROW(splice_strided_parallel(0, input), InvalidChannelCount);
    EXPECT_THROW(splice_simd(0, input), InvalidChannelCount);
    for (SpliceStrategy strategy : all_strategies()) {
        EXPECT_THROW(splice(strategy, 0, input), InvalidChannelCount) << strategy_name(strategy);
    }
}

TEST_F(SpliceTest, ZeroChannelsThrowsOnEmptyInput) {
    const std::vector<uint8_t> empty;
    for (SpliceStrategy strategy : all_strategies()) {
        EXPECT_THROW(splice(strategy, 0, empty), InvalidChannelCount) << strategy_name(strategy);
    }
}

//==============================================================================
// gather_strided
//==============================================================================

TEST_F(SpliceTest, GatherStridedBasic) {
    const auto input = EightElementInput();
    EXPECT_EQ(gather_strided(input, 0, 3), (Channel{0, 3, 6}));
    EXPECT_EQ(gather_strided(input, 2, 3), (Channel{2, 5}));
    EXPECT_EQ(gather_strided(input, 7, 1), (Channel{7}));
    EXPECT_TRUE(gather_strided(input, 8, 2).empty());
    EXPECT_THROW(gather_strided(input, 0, 0), InvalidChannelCount);

    // 위치 + stride가 size_t 범위를 넘는 경우: 원소는 한 번만, 순서대로
    const size_t huge = std::numeric_limits<size_t>::max();
    const std::vector<uint8_t> small = {10, 11, 12};
    EXPECT_EQ(gather_strided(small, 1, huge), (Channel{11}));
    EXPECT_EQ(gather_strided(small, 0, huge), (Channel{10}));
    EXPECT_EQ(gather_strided(small, 2, huge - 1), (Channel{12}));
    EXPECT_TRUE(gather_strided(small, 3, huge).empty());
    // 마지막 원소에 정확히 도달하는 stride
    EXPECT_EQ(gather_strided(small, 0, 2), (Channel{10, 12}));
    EXPECT_EQ(gather_strided(small, 0, 3), (Channel{10}));
}

//==============================================================================
// 병렬 구현: 순서 안정성
//==============================================================================

TEST_F(SpliceTest, StridedParallelOrderIsStable) {
    const auto input = RandomBytes(1 << 16, 4242u);
    const Channels expected = splice_strided(37, input);
    for (int run = 0; run < 20; ++run) {
        EXPECT_EQ(splice_strided_parallel(37, input), expected) << "run " << run;
    }
}

TEST_F(SpliceTest, StridedParallelManyChannels) {
    // 워커 수보다 훨씬 많은 채널
    const size_t channels = worker_count() * 8 + 3;
    const auto input = RandomBytes(channels * 50 + 7, 31u);
    EXPECT_EQ(splice_strided_parallel(channels, input), ReferenceSplice(channels, input));
}

TEST_F(SpliceTest, WorkerCountPositive) {
    EXPECT_GE(worker_count(), 1u);
}

//==============================================================================
// 전략 이름
//==============================================================================

TEST_F(SpliceTest, StrategyNames) {
    EXPECT_STREQ(strategy_name(SpliceStrategy::DIRECT), "direct");
    EXPECT_STREQ(strategy_name(SpliceStrategy::STRIDED), "strided");
    EXPECT_STREQ(strategy_name(SpliceStrategy::STRIDED_PARALLEL), "strided_parallel");
    EXPECT_STREQ(strategy_name(SpliceStrategy::SIMD), "simd");

    for (SpliceStrategy strategy : all_strategies()) {
        EXPECT_EQ(parse_strategy(strategy_name(strategy)), strategy);
    }
    EXPECT_THROW(parse_strategy("stepped"), std::invalid_argument);
    EXPECT_THROW(parse_strategy(""), std::invalid_argument);
    EXPECT_EQ(all_strategies().size(), 4u);
}

TEST_F(SpliceTest, SimdTargetReported) {
    const char* target = simd_target();
    ASSERT_NE(target, nullptr);
    EXPECT_GT(std::string(target).size(), 0u);
}
