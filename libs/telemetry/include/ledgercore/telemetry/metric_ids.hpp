#pragma once

#include <cstdint>
#include <string_view>

namespace ledgercore {
namespace telemetry {
namespace metrics {

inline constexpr std::uint64_t kCommitsApplied = 1;
inline constexpr std::uint64_t kCommitsRejected = 2;
inline constexpr std::uint64_t kCommitConflicts = 3;
inline constexpr std::uint64_t kEntriesAccepted = 10;
inline constexpr std::uint64_t kEntriesRejected = 11;
inline constexpr std::uint64_t kInvoicesCreated = 20;
inline constexpr std::uint64_t kLineMutations = 21;
inline constexpr std::uint64_t kLinesRejected = 22;
inline constexpr std::uint64_t kTotalsRecomputed = 23;
inline constexpr std::uint64_t kTotalsRecomputeLatency = 24;
inline constexpr std::uint64_t kJournalRecordsWritten = 30;
inline constexpr std::uint64_t kJournalRecordsReplayed = 31;

std::string_view name_of(std::uint64_t id) noexcept;

}  // namespace metrics
}  // namespace telemetry
}  // namespace ledgercore
