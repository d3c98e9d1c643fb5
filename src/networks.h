#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace tollgate {

struct NetworkInfo {
    std::string caip2;        // "eip155:<chain id>"
    std::string name;
    uint64_t    chain_id;
    std::string usdc_address; // EIP-55
    std::string explorer_tx_url;
    std::string rpc_url;
};

static constexpr const char* DEFAULT_NETWORK = "eip155:324705682";
static constexpr const char* DEFAULT_ASSET   = "0x2e08028E3C4c2356572E096d8EF835cD5C6030bD";

const std::vector<NetworkInfo>& known_networks();
// nullptr for unknown networks
const NetworkInfo* find_network(const std::string& caip2);

// "eip155:<digits>" only
bool parse_chain_id(const std::string& caip2, uint64_t& out);

// Token contract the network is expected to pay in; empty for unknown networks.
std::string expected_asset(const std::string& caip2);

std::string explorer_url(const std::string& caip2, const std::string& tx_hash);

}
