#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include <string>

namespace tollgate {

bool secure_random(uint8_t* out, size_t len, std::string* err = nullptr);

// Throws EngineError(ENCRYPTION_FAILED) when the OS generator is unavailable.
std::vector<uint8_t> random_bytes(size_t n);

// RFC 4122 version 4, lowercase
std::string random_uuid();

// Overwrite memory the optimizer may not elide.
void secure_wipe(void* p, size_t len);
inline void secure_wipe(std::vector<uint8_t>& v){ if(!v.empty()) secure_wipe(v.data(), v.size()); }
inline void secure_wipe(std::string& s){ if(!s.empty()) secure_wipe(&s[0], s.size()); }

}
