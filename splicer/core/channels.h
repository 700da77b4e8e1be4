#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace splicer {

/**
 * 스플라이스 결과: N개의 채널, 채널 i는 입력 위치 p (p % N == i)의 바이트들을
 * 입력 순서대로 담습니다. 모든 버퍼는 호출자가 소유합니다.
 */
using Channel = std::vector<uint8_t>;
using Channels = std::vector<Channel>;

/**
 * 채널 수가 0일 때 던져지는 전제조건 위반 예외
 * 어떤 출력도 만들어지기 전에 동기적으로 발생합니다.
 */
class InvalidChannelCount : public std::invalid_argument {
public:
    InvalidChannelCount();
};

/**
 * 채널 수 검증
 * @throws InvalidChannelCount channels == 0
 */
void check_channel_count(size_t channels);

/**
 * 채널 i의 길이: i < len 이면 ceil((len - i) / channels), 아니면 0
 * 앞쪽 len % channels 개 채널이 한 개씩 더 받습니다.
 *
 * @param len 입력 길이
 * @param channels 채널 수 (> 0)
 * @param index 채널 인덱스
 */
size_t channel_length(size_t len, size_t channels, size_t index) noexcept;

/**
 * 가장 긴 채널의 길이: ceil(len / channels)
 * 출력 버퍼 사전 할당의 상한으로 사용됩니다.
 */
size_t max_channel_length(size_t len, size_t channels) noexcept;

/**
 * 스플라이스의 역연산: 채널들을 원래 순서로 다시 인터리브
 * 결과의 위치 p 원소는 channels[p % N][p / N] 입니다.
 *
 * @param channels 스플라이스된 채널들
 * @return 재구성된 입력 시퀀스
 * @throws InvalidChannelCount 채널 목록이 비어 있을 때
 * @throws std::invalid_argument 채널 길이가 크기 균형 규칙을 만족하지 않을 때
 */
std::vector<uint8_t> interleave(const Channels& channels);

} // namespace splicer
