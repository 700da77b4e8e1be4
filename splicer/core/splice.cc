#include "splice.h"

#include <stdexcept>

namespace splicer {

//==============================================================================
// 순차 구현
//==============================================================================

Channels splice_direct(size_t channels, base::Span<const uint8_t> input) {
    check_channel_count(channels);

    const size_t each_len = max_channel_length(input.size(), channels);
    Channels out(channels);
    for (auto& ch : out) {
        ch.reserve(each_len);
    }

    // 위치 p의 원소를 채널 p % channels에 추가 (나머지 연산 대신 순환 카운터)
    size_t target = 0;
    for (const uint8_t value : input) {
        out[target].push_back(value);
        if (++target == channels) {
            target = 0;
        }
    }
    return out;
}

Channel gather_strided(base::Span<const uint8_t> input, size_t offset, size_t stride) {
    check_channel_count(stride);

    Channel ch;
    ch.reserve(channel_length(input.size(), stride, offset));
    for (size_t p = offset; p < input.size(); p += stride) {
        ch.push_back(input[p]);
        // 다음 위치가 입력 끝을 넘으면 종료 (p + stride의 size_t 순환 방지)
        if (stride >= input.size() - p) {
            break;
        }
    }
    return ch;
}

Channels splice_strided(size_t channels, base::Span<const uint8_t> input) {
    check_channel_count(channels);

    Channels out;
    out.reserve(channels);
    for (size_t offset = 0; offset < channels; ++offset) {
        out.push_back(gather_strided(input, offset, channels));
    }
    return out;
}

//==============================================================================
// 전략 디스패치
//==============================================================================

Channels splice(SpliceStrategy strategy, size_t channels, base::Span<const uint8_t> input) {
    switch (strategy) {
        case SpliceStrategy::DIRECT:
            return splice_direct(channels, input);
        case SpliceStrategy::STRIDED:
            return splice_strided(channels, input);
        case SpliceStrategy::STRIDED_PARALLEL:
            return splice_strided_parallel(channels, input);
        case SpliceStrategy::SIMD:
            return splice_simd(channels, input);
    }
    throw std::invalid_argument("Unknown splice strategy");
}

const char* strategy_name(SpliceStrategy strategy) noexcept {
    switch (strategy) {
        case SpliceStrategy::DIRECT:           return "direct";
        case SpliceStrategy::STRIDED:          return "strided";
        case SpliceStrategy::STRIDED_PARALLEL: return "strided_parallel";
        case SpliceStrategy::SIMD:             return "simd";
    }
    return "unknown";
}

SpliceStrategy parse_strategy(const std::string& name) {
    for (const SpliceStrategy strategy : all_strategies()) {
        if (name == strategy_name(strategy)) {
            return strategy;
        }
    }
    throw std::invalid_argument("Unknown splice strategy: " + name);
}

const std::vector<SpliceStrategy>& all_strategies() {
    static const std::vector<SpliceStrategy> strategies = {
        SpliceStrategy::DIRECT,
        SpliceStrategy::STRIDED,
        SpliceStrategy::STRIDED_PARALLEL,
        SpliceStrategy::SIMD,
    };
    return strategies;
}

} // namespace splicer
