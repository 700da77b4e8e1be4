#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <cstdint>
#include <exception>
#include <string>
#include <vector>

#include "splicer/splicer.h"

namespace {

// 채널들을 "[[0, 4], [1, 5], ...]" 형식으로 출력
std::string FormatChannels(const splicer::Channels& channels) {
  std::vector<std::string> parts;
  parts.reserve(channels.size());
  for (const auto& ch : channels) {
    parts.push_back(fmt::format("[{}]", fmt::join(ch, ", ")));
  }
  return fmt::format("[{}]", fmt::join(parts, ", "));
}

}  // namespace

int main() {
  // spdlog 로거 설정
  auto console = spdlog::stdout_color_mt("console");
  spdlog::set_default_logger(console);
  spdlog::set_level(spdlog::level::info);

  SPDLOG_INFO("splice demo 시작");
  SPDLOG_INFO("OpenMP 워커 수: {}", splicer::worker_count());
  SPDLOG_INFO("Highway SIMD 타겟: {}", splicer::simd_target());

  // 벤치마크 스모크 비교와 같은 7개 원소 입력
  const std::vector<uint8_t> input = {0, 1, 2, 3, 4, 5, 6};
  SPDLOG_INFO("입력: [{}]", fmt::join(input, ", "));

  int mismatches = 0;
  try {
    for (size_t channels = 1; channels <= input.size(); ++channels) {
      const splicer::Channels reference = splicer::splice_direct(channels, input);
      SPDLOG_INFO("channels={} -> {}", channels, FormatChannels(reference));

      for (const splicer::SpliceStrategy strategy : splicer::all_strategies()) {
        splicer::Splicer runner(splicer::SplicerConfig{channels, strategy});
        const splicer::Channels result = runner.run(input);
        if (result != reference) {
          SPDLOG_ERROR("{} 결과 불일치 (channels={}): {}",
                       splicer::strategy_name(strategy), channels, FormatChannels(result));
          ++mismatches;
        }
      }
    }
  } catch (const std::exception& e) {
    SPDLOG_ERROR("스플라이스 실패: {}", e.what());
    return 1;
  }

  if (mismatches > 0) {
    SPDLOG_ERROR("{}개 전략 결과가 direct와 다름", mismatches);
    return 1;
  }

  SPDLOG_INFO("모든 전략 결과 일치 ({}개 전략)", splicer::all_strategies().size());
  return 0;
}
