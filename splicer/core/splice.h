#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "splicer/base/span.h"
#include "splicer/core/channels.h"

namespace splicer {

/**
 * SIMD 디인터리브가 지원하는 최대 채널 수
 * Highway의 LoadInterleaved2/3/4에 대응합니다.
 */
constexpr size_t kMaxSimdChannels = 4;

/**
 * 스플라이스 알고리즘 종류
 * 모든 전략은 같은 입력에 대해 바이트 단위로 동일한 결과를 냅니다.
 */
enum class SpliceStrategy {
    DIRECT,           // 단일 순차 패스, 채널별 버퍼에 분산 쓰기
    STRIDED,          // 채널당 한 번의 stride 패스
    STRIDED_PARALLEL, // STRIDED의 채널 패스들을 OpenMP 워커에 분배
    SIMD              // Highway 디인터리브 (2..4 채널), 그 외는 DIRECT
};

/**
 * Direct 스플라이스: 입력을 한 번 순회하며 위치 p의 원소를 채널 p % N에 추가
 * 각 채널 버퍼는 ceil(len / N) 용량으로 미리 예약됩니다.
 *
 * @param channels 채널 수 (> 0)
 * @param input 읽기 전용 입력
 * @return N개의 채널
 * @throws InvalidChannelCount channels == 0
 */
Channels splice_direct(size_t channels, base::Span<const uint8_t> input);

/**
 * Strided 스플라이스: 채널 i마다 오프셋 i에서 시작해 stride N으로 입력을 순회
 * 쓰기는 채널별로 연속적이고 읽기는 stride 간격입니다.
 *
 * @throws InvalidChannelCount channels == 0
 */
Channels splice_strided(size_t channels, base::Span<const uint8_t> input);

/**
 * Strided-Parallel 스플라이스: splice_strided와 같은 패스를 OpenMP 스레드 팀에서 실행
 * 결과 i는 완료 순서와 무관하게 항상 오프셋 i의 채널입니다.
 * 워커에서 발생한 예외는 조인 후 호출자에게 다시 던져집니다.
 *
 * @throws InvalidChannelCount channels == 0
 */
Channels splice_strided_parallel(size_t channels, base::Span<const uint8_t> input);

/**
 * SIMD 스플라이스: 2..kMaxSimdChannels 채널은 Highway 런타임 디스패치로 디인터리브,
 * 그 외 채널 수는 splice_direct로 위임합니다.
 *
 * @throws InvalidChannelCount channels == 0
 */
Channels splice_simd(size_t channels, base::Span<const uint8_t> input);

/**
 * 선택된 전략으로 스플라이스
 */
Channels splice(SpliceStrategy strategy, size_t channels, base::Span<const uint8_t> input);

/**
 * 단일 채널 수집: input[offset], input[offset + stride], ... 를 순서대로 복사
 * Strided 계열 구현의 공통 빌딩 블록이며 테스트 목적으로 노출됩니다.
 *
 * @param input 읽기 전용 입력
 * @param offset 시작 위치 (채널 인덱스)
 * @param stride 간격 (채널 수, > 0)
 */
Channel gather_strided(base::Span<const uint8_t> input, size_t offset, size_t stride);

/**
 * 전략 이름 ("direct", "strided", "strided_parallel", "simd")
 */
const char* strategy_name(SpliceStrategy strategy) noexcept;

/**
 * 이름으로 전략 조회
 * @throws std::invalid_argument 알 수 없는 이름
 */
SpliceStrategy parse_strategy(const std::string& name);

/**
 * 모든 전략 목록 (선언 순서)
 */
const std::vector<SpliceStrategy>& all_strategies();

/**
 * Strided-Parallel이 사용하는 OpenMP 워커 수
 */
size_t worker_count() noexcept;

/**
 * Highway가 런타임에 선택한 SIMD 타겟 이름 (예: "AVX2")
 */
const char* simd_target() noexcept;

} // namespace splicer
