#include "crypto/keccak256.h"
#include <cstring>

namespace tollgate {

static const uint64_t RC[24] = {
  0x0000000000000001ULL,0x0000000000008082ULL,0x800000000000808aULL,0x8000000080008000ULL,
  0x000000000000808bULL,0x0000000080000001ULL,0x8000000080008081ULL,0x8000000000008009ULL,
  0x000000000000008aULL,0x0000000000000088ULL,0x0000000080008009ULL,0x000000008000000aULL,
  0x000000008000808bULL,0x800000000000008bULL,0x8000000000008089ULL,0x8000000000008003ULL,
  0x8000000000008002ULL,0x8000000000000080ULL,0x000000000000800aULL,0x800000008000000aULL,
  0x8000000080008081ULL,0x8000000000008080ULL,0x0000000080000001ULL,0x8000000080008008ULL
};

static const unsigned ROTC[24] = {
  1,3,6,10,15,21,28,36,45,55,2,14,27,41,56,8,25,43,62,18,39,61,20,44
};

static const unsigned PILN[24] = {
  10,7,11,17,18,3,5,16,8,21,24,4,15,23,19,13,12,2,20,14,22,9,6,1
};

static inline uint64_t rotl64(uint64_t x, unsigned n){ return (x<<n) | (x>>(64u-n)); }

static void keccakf(uint64_t st[25]){
    uint64_t bc[5];
    for(int round=0; round<24; ++round){
        // theta
        for(int i=0;i<5;i++) bc[i] = st[i]^st[i+5]^st[i+10]^st[i+15]^st[i+20];
        for(int i=0;i<5;i++){
            const uint64_t t = bc[(i+4)%5] ^ rotl64(bc[(i+1)%5], 1);
            for(int j=0;j<25;j+=5) st[j+i] ^= t;
        }
        // rho + pi
        uint64_t t = st[1];
        for(int i=0;i<24;i++){
            const unsigned j = PILN[i];
            const uint64_t tmp = st[j];
            st[j] = rotl64(t, ROTC[i]);
            t = tmp;
        }
        // chi
        for(int j=0;j<25;j+=5){
            for(int i=0;i<5;i++) bc[i] = st[j+i];
            for(int i=0;i<5;i++) st[j+i] ^= (~bc[(i+1)%5]) & bc[(i+2)%5];
        }
        // iota
        st[0] ^= RC[round];
    }
}

static inline void absorb_block(uint64_t st[25], const uint8_t block[136]){
    for(int i=0;i<17;i++){
        uint64_t lane = 0;
        for(int b=0;b<8;b++) lane |= (uint64_t)block[8*i+b] << (8*b);
        st[i] ^= lane;
    }
    keccakf(st);
}

void Keccak256::init(){
    std::memset(st, 0, sizeof(st));
    idx = 0;
}

void Keccak256::update(const uint8_t* data, size_t len){
    size_t off = 0;
    while(off < len){
        const size_t to_copy = (len - off < sizeof(buf) - idx) ? (len - off) : (sizeof(buf) - idx);
        std::memcpy(buf + idx, data + off, to_copy);
        idx += to_copy;
        off += to_copy;
        if(idx == sizeof(buf)){
            absorb_block(st, buf);
            idx = 0;
        }
    }
}

void Keccak256::final(uint8_t out[32]){
    std::memset(buf + idx, 0, sizeof(buf) - idx);
    buf[idx] ^= 0x01;
    buf[sizeof(buf) - 1] ^= 0x80;
    absorb_block(st, buf);
    for(int i=0;i<4;i++){
        for(int b=0;b<8;b++) out[8*i+b] = (uint8_t)(st[i] >> (8*b));
    }
}

std::vector<uint8_t> keccak256(const std::vector<uint8_t>& data){
    Keccak256 k; k.init();
    k.update(data.data(), data.size());
    std::vector<uint8_t> out(32);
    k.final(out.data());
    return out;
}

std::vector<uint8_t> keccak256(const std::string& data){
    Keccak256 k; k.init();
    k.update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    std::vector<uint8_t> out(32);
    k.final(out.data());
    return out;
}

}
