#pragma once
#include <cstdint>
#include <string>

namespace tollgate {

// UNIX time (seconds since epoch)
uint64_t now();
// UNIX time in milliseconds
int64_t now_ms();

// "2026-03-01T12:34:56.789Z"
std::string iso8601_utc(int64_t ms);
// Accepts "YYYY-MM-DDTHH:MM:SS[.fff]Z" and a bare "YYYY-MM-DD" (midnight UTC).
bool parse_iso8601_utc(const std::string& s, int64_t& out_ms);

// Start of the UTC calendar day containing `ms`.
int64_t utc_day_start_ms(int64_t ms);

} // namespace tollgate
