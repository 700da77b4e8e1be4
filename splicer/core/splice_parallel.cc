#include "splice.h"

#include <omp.h>

#include "fork_join.h"

namespace splicer {

Channels splice_strided_parallel(size_t channels, base::Span<const uint8_t> input) {
    check_channel_count(channels);

    // 채널 i = 오프셋 i의 stride 패스, 입력은 모든 워커가 읽기 전용으로 공유
    return parallel_collect<Channel>(channels, [input, channels](size_t offset) {
        return gather_strided(input, offset, channels);
    });
}

size_t worker_count() noexcept {
    return static_cast<size_t>(omp_get_max_threads());
}

} // namespace splicer
