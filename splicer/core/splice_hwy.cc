#include <cstddef>
#include <cstdint>

#include "splicer/core/splice.h"

// Highway 헤더들
#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "splicer/core/splice_hwy.cc"  // 이 파일 자체
#include "hwy/foreach_target.h"  // 모든 타겟에 대한 코드 생성
#include "hwy/highway.h"

HWY_BEFORE_NAMESPACE();
namespace splicer {
namespace HWY_NAMESPACE {  // 각 타겟별로 다른 네임스페이스

namespace hn = hwy::HWY_NAMESPACE;

/**
 * 완전한 프레임 frames개를 디인터리브: out[c][i] = in[i * channels + c]
 * channels는 2..4, out[c]는 최소 frames개 원소를 담을 수 있어야 합니다.
 */
void DeinterleaveImpl(const uint8_t* HWY_RESTRICT in, size_t frames, size_t channels,
                      uint8_t* const* out) {
    const hn::ScalableTag<uint8_t> d;
    const size_t N = hn::Lanes(d);
    size_t i = 0;

    // 메인 벡터화된 루프 - 벡터당 N 프레임
    switch (channels) {
        case 2:
            for (; i + N <= frames; i += N) {
                auto v0 = hn::Zero(d);
                auto v1 = hn::Zero(d);
                hn::LoadInterleaved2(d, in + i * 2, v0, v1);
                hn::StoreU(v0, d, out[0] + i);
                hn::StoreU(v1, d, out[1] + i);
            }
            break;
        case 3:
            for (; i + N <= frames; i += N) {
                auto v0 = hn::Zero(d);
                auto v1 = hn::Zero(d);
                auto v2 = hn::Zero(d);
                hn::LoadInterleaved3(d, in + i * 3, v0, v1, v2);
                hn::StoreU(v0, d, out[0] + i);
                hn::StoreU(v1, d, out[1] + i);
                hn::StoreU(v2, d, out[2] + i);
            }
            break;
        case 4:
            for (; i + N <= frames; i += N) {
                auto v0 = hn::Zero(d);
                auto v1 = hn::Zero(d);
                auto v2 = hn::Zero(d);
                auto v3 = hn::Zero(d);
                hn::LoadInterleaved4(d, in + i * 4, v0, v1, v2, v3);
                hn::StoreU(v0, d, out[0] + i);
                hn::StoreU(v1, d, out[1] + i);
                hn::StoreU(v2, d, out[2] + i);
                hn::StoreU(v3, d, out[3] + i);
            }
            break;
        default:
            break;
    }

    // 나머지 프레임들을 스칼라로 처리
    for (; i < frames; ++i) {
        for (size_t c = 0; c < channels; ++c) {
            out[c][i] = in[i * channels + c];
        }
    }
}

const char* TargetNameImpl() {
    return hwy::TargetName(HWY_TARGET);
}

}  // namespace HWY_NAMESPACE
}  // namespace splicer
HWY_AFTER_NAMESPACE();

#if HWY_ONCE

namespace splicer {

HWY_EXPORT(DeinterleaveImpl);
HWY_EXPORT(TargetNameImpl);

Channels splice_simd(size_t channels, base::Span<const uint8_t> input) {
    check_channel_count(channels);
    if (channels < 2 || channels > kMaxSimdChannels) {
        return splice_direct(channels, input);
    }

    const size_t len = input.size();
    Channels out(channels);
    uint8_t* dst[kMaxSimdChannels] = {};
    for (size_t c = 0; c < channels; ++c) {
        out[c].resize(channel_length(len, channels, c));
        dst[c] = out[c].data();
    }

    const size_t frames = len / channels;
    if (frames > 0) {
        HWY_DYNAMIC_DISPATCH(DeinterleaveImpl)(input.data(), frames, channels, dst);
    }

    // 마지막 불완전 프레임: 앞쪽 len % channels 개 채널의 마지막 원소
    for (size_t p = frames * channels; p < len; ++p) {
        out[p - frames * channels][frames] = input[p];
    }
    return out;
}

const char* simd_target() noexcept {
    return HWY_DYNAMIC_DISPATCH(TargetNameImpl)();
}

}  // namespace splicer

#endif  // HWY_ONCE
