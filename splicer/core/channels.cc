#include "channels.h"

#include <string>

namespace splicer {

InvalidChannelCount::InvalidChannelCount()
    : std::invalid_argument("Channels must be greater than 0") {
}

void check_channel_count(size_t channels) {
    if (channels == 0) {
        throw InvalidChannelCount();
    }
}

size_t channel_length(size_t len, size_t channels, size_t index) noexcept {
    if (index >= len) {
        return 0;
    }
    // index < len 이므로 위치 index는 항상 포함됨, 큰 channels에서도 오버플로 없음
    return (len - index - 1) / channels + 1;
}

size_t max_channel_length(size_t len, size_t channels) noexcept {
    return len / channels + (len % channels == 0 ? 0 : 1);
}

std::vector<uint8_t> interleave(const Channels& channels) {
    check_channel_count(channels.size());

    const size_t n = channels.size();
    size_t total = 0;
    for (const auto& ch : channels) {
        total += ch.size();
    }

    for (size_t i = 0; i < n; ++i) {
        if (channels[i].size() != channel_length(total, n, i)) {
            throw std::invalid_argument(
                "Channel " + std::to_string(i) + " has " + std::to_string(channels[i].size()) +
                " elements, expected " + std::to_string(channel_length(total, n, i)));
        }
    }

    std::vector<uint8_t> out(total);
    for (size_t i = 0; i < n; ++i) {
        const Channel& ch = channels[i];
        for (size_t k = 0; k < ch.size(); ++k) {
            out[k * n + i] = ch[k];
        }
    }
    return out;
}

} // namespace splicer
