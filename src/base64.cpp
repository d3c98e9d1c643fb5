#include "base64.h"

#include <openssl/evp.h>

namespace tollgate {

static bool is_b64_char(char c){
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

std::string base64_encode(const std::vector<uint8_t>& data){
    if(data.empty()) return std::string();
    std::string out;
    out.resize(4 * ((data.size() + 2) / 3));
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(), (int)data.size());
    out.resize(n > 0 ? (size_t)n : 0);
    return out;
}

std::string base64_encode(const std::string& data){
    return base64_encode(std::vector<uint8_t>(data.begin(), data.end()));
}

bool base64_decode(const std::string& in, std::vector<uint8_t>& out){
    out.clear();
    if(in.empty()) return true;

    std::string s = in;
    size_t body = s.size();
    while(body > 0 && s[body-1] == '=') --body;
    if(s.size() - body > 2) return false;
    for(size_t i = 0; i < body; ++i){
        if(!is_b64_char(s[i])) return false;
    }
    if(body % 4 == 1) return false;
    // EVP_DecodeBlock wants padded input
    s.resize(body);
    while(s.size() % 4) s.push_back('=');
    const size_t pad = s.size() - body;

    out.resize(3 * (s.size() / 4));
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(s.data()), (int)s.size());
    if(n < 0 || (size_t)n < pad){ out.clear(); return false; }
    out.resize((size_t)n - pad);
    return true;
}

bool base64_decode(const std::string& in, std::string& out){
    std::vector<uint8_t> v;
    if(!base64_decode(in, v)) return false;
    out.assign(v.begin(), v.end());
    return true;
}

}
