#include "crypto/secure_random.h"
#include "errors.h"
#include "hex.h"

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#if defined(__linux__)
  #include <sys/syscall.h>
  #include <linux/random.h>
#endif

#include <openssl/crypto.h> // OPENSSL_cleanse
#include <cstring>

namespace tollgate {

static bool urandom_read(uint8_t* out, size_t len){
    int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
    if(fd < 0) return false;
    size_t off=0;
    while(off < len){
        ssize_t r = ::read(fd, out+off, len-off);
        if(r <= 0){ if(r < 0 && errno == EINTR) continue; ::close(fd); return false; }
        off += (size_t)r;
    }
    ::close(fd);
    return true;
}

bool secure_random(uint8_t* out, size_t len, std::string* err){
#if defined(__linux__)
    size_t off = 0;
    while(off < len){
        long r = syscall(SYS_getrandom, out + off, len - off, 0);
        if(r < 0){
            if(errno == EINTR) continue;
            break;
        }
        off += (size_t)r;
    }
    if(off == len) return true;
#endif
    if(urandom_read(out, len)) return true;
    if(err) *err = "getrandom()/urandom failed";
    return false;
}

std::vector<uint8_t> random_bytes(size_t n){
    std::vector<uint8_t> v(n);
    std::string err;
    if(!secure_random(v.data(), v.size(), &err)){
        throw EngineError(ErrorCode::ENCRYPTION_FAILED, err);
    }
    return v;
}

std::string random_uuid(){
    std::vector<uint8_t> b = random_bytes(16);
    b[6] = (uint8_t)((b[6] & 0x0f) | 0x40);
    b[8] = (uint8_t)((b[8] & 0x3f) | 0x80);
    const std::string h = to_hex(b);
    return h.substr(0,8) + "-" + h.substr(8,4) + "-" + h.substr(12,4) + "-" +
           h.substr(16,4) + "-" + h.substr(20,12);
}

void secure_wipe(void* p, size_t len){
    if(p && len) OPENSSL_cleanse(p, len);
}

}
