#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 검증 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_validation / on_execution_failure:
//   디스패치 경로에서 concurrent 호출 안전 (atomic 사용).
// - snapshot():
//   조회 경로에서 호출. 갱신 경로와 contention 없이 읽기 가능.
//
// [격리 원칙]
// - 통계 수집 실패가 검증 경로로 전파되지 않도록
//   모든 갱신 메서드는 noexcept 로 선언한다.
//
// [일관성]
// - 카운터별 relaxed 로드이므로 스냅샷의 필드 간 합계가 순간적으로
//   어긋날 수 있다 (예: total 은 증가했으나 per_class 는 아직).
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

// ---------------------------------------------------------------------------
// ClassStats
//   작업 분류 하나의 누적 카운터 값.
// ---------------------------------------------------------------------------
struct ClassStats {
    std::uint64_t accepted{0};
    std::uint64_t rejected{0};
};

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   qps        : 수집기 생성 이후 평균 초당 검증 수
//   reject_rate: rejected_queries / total_queries (total == 0 이면 0.0)
//   per_class  : OperationClass 값을 인덱스로 사용
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                                  total_queries{0};
    std::uint64_t                                  rejected_queries{0};
    std::uint64_t                                  execution_failures{0};
    double                                         qps{0.0};
    double                                         reject_rate{0.0};
    std::array<ClassStats, kOperationClassCount>   per_class{};
    std::chrono::system_clock::time_point          captured_at{};
};

// ---------------------------------------------------------------------------
// StatsCollector
//   검증 결과를 집계하고 StatsSnapshot 을 제공한다.
// ---------------------------------------------------------------------------
class StatsCollector {
public:
    StatsCollector() noexcept
        : total_queries_{0}
        , rejected_queries_{0}
        , execution_failures_{0}
        , window_start_(std::chrono::system_clock::now())
    {
        for (std::size_t i = 0; i < kOperationClassCount; ++i) {
            accepted_[i].store(0, std::memory_order_relaxed);
            rejected_[i].store(0, std::memory_order_relaxed);
        }
    }

    ~StatsCollector() = default;

    // 복사 금지 (atomic 은 복사 불가)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;

    // 이동 금지 (atomic 소유권 명확화)
    StatsCollector(StatsCollector&&)            = delete;
    StatsCollector& operator=(StatsCollector&&) = delete;

    // on_validation
    //   검증 한 건 완료 시 호출.
    //   rejected: 검증 실패(또는 디스패처 사전 거부)면 true
    void on_validation(OperationClass op, bool rejected) noexcept {
        total_queries_.fetch_add(1, std::memory_order_relaxed);
        const auto idx = static_cast<std::size_t>(op);
        if (rejected) {
            rejected_queries_.fetch_add(1, std::memory_order_relaxed);
            if (idx < kOperationClassCount) {
                rejected_[idx].fetch_add(1, std::memory_order_relaxed);
            }
        } else if (idx < kOperationClassCount) {
            accepted_[idx].fetch_add(1, std::memory_order_relaxed);
        }
    }

    // on_execution_failure
    //   검증은 통과했으나 실행기가 실패한 경우.
    void on_execution_failure() noexcept {
        execution_failures_.fetch_add(1, std::memory_order_relaxed);
    }

    // snapshot
    //   현재 통계의 불변 스냅샷을 반환한다 (조회 경로).
    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto now          = std::chrono::system_clock::now();
        const auto total_q      = total_queries_.load(std::memory_order_relaxed);
        const auto rejected_q   = rejected_queries_.load(std::memory_order_relaxed);
        const auto exec_fail    = execution_failures_.load(std::memory_order_relaxed);
        const auto window_start = window_start_;

        const double elapsed_sec = std::chrono::duration<double>(now - window_start).count();

        double qps = 0.0;
        if (elapsed_sec > 0.0) {
            qps = static_cast<double>(total_q) / elapsed_sec;
        }

        double reject_rate = 0.0;
        if (total_q > 0) {
            reject_rate = static_cast<double>(rejected_q) / static_cast<double>(total_q);
        }

        std::array<ClassStats, kOperationClassCount> per_class{};
        for (std::size_t i = 0; i < kOperationClassCount; ++i) {
            per_class[i].accepted = accepted_[i].load(std::memory_order_relaxed);
            per_class[i].rejected = rejected_[i].load(std::memory_order_relaxed);
        }

        return StatsSnapshot{
            .total_queries      = total_q,
            .rejected_queries   = rejected_q,
            .execution_failures = exec_fail,
            .qps                = qps,
            .reject_rate        = reject_rate,
            .per_class          = per_class,
            .captured_at        = now,
        };
    }

private:
    std::atomic<std::uint64_t>                                total_queries_;
    std::atomic<std::uint64_t>                                rejected_queries_;
    std::atomic<std::uint64_t>                                execution_failures_;
    std::array<std::atomic<std::uint64_t>, kOperationClassCount> accepted_;
    std::array<std::atomic<std::uint64_t>, kOperationClassCount> rejected_;

    // 생성 시각 (qps 기준점, 이후 변경되지 않음)
    const std::chrono::system_clock::time_point               window_start_;
};
