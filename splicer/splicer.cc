#include "splicer.h"

#include <stdexcept>

namespace splicer {

Splicer::Splicer()
    : channels_(0), strategy_(SpliceStrategy::DIRECT), params_set_(false) {
}

Splicer::Splicer(const SplicerConfig& config)
    : Splicer() {
    set_params(config.channels, config.strategy);
}

void Splicer::set_params(size_t channels, SpliceStrategy strategy) {
    check_channel_count(channels);

    channels_ = channels;
    strategy_ = strategy;
    params_set_ = true;
}

Channels Splicer::run(base::Span<const uint8_t> input) const {
    if (!params_set_) {
        throw std::logic_error("Splicer parameters not set");
    }
    return splice(strategy_, channels_, input);
}

} // namespace splicer
