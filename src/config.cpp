#include "config.h"
#include "log.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <climits>

using namespace tollgate;

static inline std::string trim(const std::string& s){
    auto a = s.find_first_not_of(" \t\r\n");
    if(a==std::string::npos) return "";
    auto b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b-a+1);
}

static bool safe_parse_uint(const std::string& v, unsigned& out, const std::string& key) {
    try {
        size_t used = 0;
        unsigned long val = std::stoul(v, &used);
        if (used != v.size() || val > UINT_MAX) {
            log_error("Config: " + key + " value '" + v + "' is out of range");
            return false;
        }
        out = static_cast<unsigned>(val);
        return true;
    } catch (const std::exception& e) {
        log_error("Config: Invalid " + key + " value '" + v + "': " + e.what());
        return false;
    }
}

static bool parse_flag(const std::string& v) {
    return v=="1" || v=="true" || v=="yes";
}

bool tollgate::load_config(const std::string& path, Config& out){
    std::ifstream f(path);
    if(!f.is_open()) return false;

    std::string line;
    int line_num = 0;
    while(std::getline(f, line)){
        ++line_num;
        line = trim(line);
        if(line.empty()) continue;
        if(line[0]=='#') continue;

        auto kpos = line.find('=');
        if(kpos==std::string::npos) {
            log_error("Config line " + std::to_string(line_num) + ": missing '=' in '" + line + "'");
            continue;
        }
        std::string k = trim(line.substr(0,kpos));
        std::string v = trim(line.substr(kpos+1));
        std::transform(k.begin(), k.end(), k.begin(), ::tolower);

        if(k=="datadir") out.datadir = v;
        else if(k=="network") out.network = v;
        else if(k=="timeout_ms") safe_parse_uint(v, out.timeout_ms, "timeout_ms");
        else if(k=="skip_verify") out.skip_verify = parse_flag(v);
        else if(k=="optimistic") out.optimistic = parse_flag(v);
        else if(k=="log_level") out.log_level = v;
        else if(k=="log_timestamps") out.log_timestamps = parse_flag(v);
        else if(k=="max_price") out.max_price = v;
        else if(k=="agent_id") out.agent_id = v;
        else if(k=="receipts") out.receipts = parse_flag(v);
        else log_warn("Config line " + std::to_string(line_num) + ": unknown key '" + k + "'");
    }
    return true;
}
