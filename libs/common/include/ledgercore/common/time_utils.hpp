#pragma once

#include <chrono>

#include "ledgercore/common/types.hpp"

namespace ledgercore {
namespace common {

inline std::chrono::nanoseconds now_steady() noexcept {
  return std::chrono::steady_clock::now().time_since_epoch();
}

inline Timestamp now_system() noexcept {
  return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

inline Date date_of(Timestamp ts) noexcept {
  return std::chrono::floor<std::chrono::days>(ts);
}

inline Date add_days(Date date, int days) noexcept {
  return date + std::chrono::days{days};
}

inline int year_of(Date date) noexcept {
  return static_cast<int>(std::chrono::year_month_day{date}.year());
}

inline Date make_date(int y, unsigned m, unsigned d) noexcept {
  return std::chrono::sys_days{std::chrono::year{y} / std::chrono::month{m} / std::chrono::day{d}};
}

}  // namespace common
}  // namespace ledgercore
