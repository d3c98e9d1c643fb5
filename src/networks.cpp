#include "networks.h"

namespace tollgate {

static const std::vector<NetworkInfo> NETWORKS = {
    {
        "eip155:324705682", "SKALE Base Sepolia", 324705682ULL,
        "0x2e08028E3C4c2356572E096d8EF835cD5C6030bD",
        "https://base-sepolia-testnet-explorer.skalenodes.com/tx/",
        "https://base-sepolia-testnet.skalenodes.com/v1/jubilant-horrible-ancha",
    },
    {
        "eip155:1187947933", "SKALE Base", 1187947933ULL,
        "0x85889c8c714505E0c94b30fcfcF64fE3Ac8FCb20",
        "https://skale-base-explorer.skalenodes.com/tx/",
        "https://skale-base.skalenodes.com/v1/base",
    },
};

static constexpr const char* FALLBACK_EXPLORER = "https://blockscan.com/tx/";

const std::vector<NetworkInfo>& known_networks() {
    return NETWORKS;
}

const NetworkInfo* find_network(const std::string& caip2) {
    for (const auto& n : NETWORKS) {
        if (n.caip2 == caip2) return &n;
    }
    return nullptr;
}

bool parse_chain_id(const std::string& caip2, uint64_t& out) {
    static const std::string prefix = "eip155:";
    if (caip2.compare(0, prefix.size(), prefix) != 0) return false;
    const std::string ref = caip2.substr(prefix.size());
    if (ref.empty() || ref.size() > 19) return false;
    uint64_t v = 0;
    for (char c : ref) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    out = v;
    return true;
}

std::string expected_asset(const std::string& caip2) {
    const NetworkInfo* n = find_network(caip2);
    return n ? n->usdc_address : std::string();
}

std::string explorer_url(const std::string& caip2, const std::string& tx_hash) {
    const NetworkInfo* n = find_network(caip2);
    return (n ? n->explorer_tx_url : std::string(FALLBACK_EXPLORER)) + tx_hash;
}

}
