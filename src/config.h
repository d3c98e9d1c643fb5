#pragma once
#include <string>
#include <cstdint>

namespace tollgate {

struct Config {
    std::string datadir;                          // empty = default_data_dir()
    std::string network = "eip155:324705682";     // default network for new wallets
    unsigned    timeout_ms = 30000;               // initial fetch timeout
    bool        skip_verify = false;              // skip facilitator /verify before /settle
    bool        optimistic = false;               // default settlement discipline for fetch
    std::string log_level = "info";
    bool        log_timestamps = true;
    std::string max_price;                        // default per-call max price (USDC), empty = none
    std::string agent_id;                         // recorded on receipts
    bool        receipts = true;                  // write receipts.jsonl
};

// Simple key=value loader. Unknown keys are logged and ignored. Returns false if file not found.
bool load_config(const std::string& path, Config& out);

}
