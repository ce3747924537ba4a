#pragma once
#include <string>

constexpr int kMinRateWpm = 100;
constexpr int kMaxRateWpm = 400;
constexpr int kDefaultRateWpm = 200;

inline bool is_valid_rate(int rate_wpm) {
  return rate_wpm >= kMinRateWpm && rate_wpm <= kMaxRateWpm;
}

// One submission. Built per submit, owned by the run that speaks it.
struct AuditRequest {
  const std::string raw_text;
  const int rate_wpm;
};
