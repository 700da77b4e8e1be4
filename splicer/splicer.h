#pragma once

#include <cstddef>
#include <cstdint>

#include "splicer/base/span.h"
#include "splicer/core/channels.h"
#include "splicer/core/splice.h"

namespace splicer {

/**
 * Splicer 설정
 */
struct SplicerConfig {
    size_t channels = 1;                             // 채널 수 (> 0)
    SpliceStrategy strategy = SpliceStrategy::DIRECT; // 사용할 알고리즘
};

/**
 * Splicer - 채널 수와 전략을 한 번 설정하고 여러 입력에 반복 적용하는 클래스
 *
 * 주요 기능:
 * - set_params()에서 채널 수 검증 (0이면 예외, 기존 설정 유지)
 * - run()은 설정된 전략의 스플라이스 함수를 호출
 * - 내부 상태는 설정값뿐이며 입력/출력 버퍼를 보관하지 않음
 */
class Splicer {
public:
    /**
     * 기본 생성자 (미설정 상태)
     */
    Splicer();

    /**
     * 설정으로 생성
     * @throws InvalidChannelCount config.channels == 0
     */
    explicit Splicer(const SplicerConfig& config);

    ~Splicer() = default;

    /**
     * 스플라이서 파라미터 설정
     *
     * @param channels 채널 수
     * @param strategy 알고리즘
     * @throws InvalidChannelCount channels == 0
     */
    void set_params(size_t channels, SpliceStrategy strategy = SpliceStrategy::DIRECT);

    /**
     * 입력을 채널들로 분할
     *
     * @param input 읽기 전용 입력
     * @return 새로 할당된 채널들
     * @throws std::logic_error 파라미터가 설정되지 않은 경우
     */
    Channels run(base::Span<const uint8_t> input) const;

    size_t channels() const { return channels_; }
    SpliceStrategy strategy() const { return strategy_; }
    bool is_configured() const { return params_set_; }

private:
    size_t channels_;
    SpliceStrategy strategy_;
    bool params_set_;
};

} // namespace splicer
