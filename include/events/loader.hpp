// Events module - candle loading functions
#pragma once

#include "types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace smc {

// Load candles from JSON file.
// Format: array of [ts, open, high, low, close, volume] or array of objects
// with ts/time, open, high, low, close, volume keys.
// max_candles keeps the most recent N candles (0 = all).
std::vector<Candle> load_candles(const std::string& path, size_t max_candles = 0);

// Load candles from CSV (with or without header).
// Time column may hold unix seconds/ms or "YYYY-MM-DD HH:MM[:SS]" (UTC).
std::vector<Candle> load_candles_csv(const std::string& path, size_t max_candles = 0);

// Dispatch on extension (.csv -> CSV, anything else -> JSON)
std::vector<Candle> load_candles_auto(const std::string& path, size_t max_candles = 0);

// Parse a timestamp token (unix s/ms or calendar string, UTC). Returns 0 on failure.
uint64_t parse_timestamp(const std::string& token);

// Sort by ts, keep the last max_candles and assign index 0..N-1
void finalize_series(std::vector<Candle>& candles, size_t max_candles);

} // namespace smc
