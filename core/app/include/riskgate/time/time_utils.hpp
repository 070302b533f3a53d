#pragma once

#include <cstdint>

namespace riskgate {

inline constexpr std::int64_t kMillisPerHour = 3600LL * 1000LL;
inline constexpr std::int64_t kMillisPerDay = 24LL * kMillisPerHour;

// Floor division; std::int64_t division truncates toward zero.
inline constexpr std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
}

// -------------------------------------------------------------------------
// tradingDayIndex
// -------------------------------------------------------------------------
// @brief  Number of the trading day containing now_ms.
//
// @param  now_ms         Epoch milliseconds (UTC).
// @param  rollover_hour  Hour of day (UTC, 0-23) at which a new trading
//                        day starts.
//
// @details
// Day N covers [N * 1d + rollover_hour, (N + 1) * 1d + rollover_hour). Two
// instants belong to the same trading day iff their indices are equal.
// -------------------------------------------------------------------------
inline constexpr std::int64_t tradingDayIndex(std::int64_t now_ms,
                                              int rollover_hour) {
  return floorDiv(now_ms - rollover_hour * kMillisPerHour, kMillisPerDay);
}

// Drawdown windows are consecutive blocks of window_days trading days.
inline constexpr std::int64_t drawdownWindowIndex(std::int64_t now_ms,
                                                  int rollover_hour,
                                                  int window_days) {
  return floorDiv(tradingDayIndex(now_ms, rollover_hour),
                  window_days > 0 ? window_days : 1);
}

}  // namespace riskgate
