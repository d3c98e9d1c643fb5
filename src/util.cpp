#include "util.h"
#include <chrono>
#include <cstdio>
#include <ctime>

namespace tollgate {

uint64_t now() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<seconds>(system_clock::now().time_since_epoch()).count()
    );
}

int64_t now_ms() {
    using namespace std::chrono;
    return static_cast<int64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count()
    );
}

std::string iso8601_utc(int64_t ms) {
    const std::time_t tt = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms % 1000));
    return buf;
}

bool parse_iso8601_utc(const std::string& s, int64_t& out_ms) {
    int Y = 0, M = 0, D = 0, h = 0, m = 0, sec = 0, frac = 0;
    int consumed = 0;
    if (s.size() == 10) {
        if (std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &Y, &M, &D, &consumed) != 3 || consumed != 10) return false;
    } else {
        if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &Y, &M, &D, &h, &m, &sec, &consumed) != 6) return false;
        size_t i = static_cast<size_t>(consumed);
        if (i < s.size() && s[i] == '.') {
            ++i;
            int digits = 0;
            while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
                if (digits < 3) { frac = frac * 10 + (s[i] - '0'); ++digits; }
                ++i;
            }
            while (digits < 3) { frac *= 10; ++digits; }
        }
        if (i >= s.size() || s[i] != 'Z' || i + 1 != s.size()) return false;
    }
    if (M < 1 || M > 12 || D < 1 || D > 31 || h > 23 || m > 59 || sec > 60) return false;

    std::tm tm{};
    tm.tm_year = Y - 1900;
    tm.tm_mon = M - 1;
    tm.tm_mday = D;
    tm.tm_hour = h;
    tm.tm_min = m;
    tm.tm_sec = sec;
    const std::time_t tt = timegm(&tm);
    out_ms = static_cast<int64_t>(tt) * 1000 + frac;
    return true;
}

int64_t utc_day_start_ms(int64_t ms) {
    static constexpr int64_t DAY_MS = 86400000;
    return ms - (ms % DAY_MS);
}

} // namespace tollgate
