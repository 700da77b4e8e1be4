#pragma once

#include <cstddef>
#include <exception>
#include <utility>
#include <vector>

namespace splicer {

/**
 * Fork-join 수집: task(0) .. task(count - 1)을 OpenMP 스레드 팀에서 실행하고
 * 결과를 태스크 인덱스 순서로 담은 벡터를 반환합니다.
 *
 * - 결과 슬롯은 미리 할당되며 각 태스크는 자신의 슬롯에만 씁니다.
 * - 순서는 완료 순서가 아니라 슬롯 인덱스로 결정됩니다.
 * - 태스크가 예외를 던지면 조인 후 첫 번째 예외를 다시 던지며, 부분 결과는 버려집니다.
 *
 * @param count 태스크 수
 * @param task size_t 인덱스를 받아 Result를 반환하는 호출 가능 객체 (동시에 호출됨)
 */
template <typename Result, typename Task>
std::vector<Result> parallel_collect(size_t count, Task&& task) {
    std::vector<Result> results(count);
    std::exception_ptr failure;

    const std::ptrdiff_t task_count = static_cast<std::ptrdiff_t>(count);

    #pragma omp parallel for schedule(static)
    for (std::ptrdiff_t index = 0; index < task_count; ++index) {
        try {
            results[static_cast<size_t>(index)] = task(static_cast<size_t>(index));
        } catch (...) {
            // 예외는 parallel 영역 밖으로 나갈 수 없으므로 첫 번째 것만 보관
            #pragma omp critical(splicer_fork_join_failure)
            {
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
    return results;
}

} // namespace splicer
