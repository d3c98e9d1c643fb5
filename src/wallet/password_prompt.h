#pragma once
#include <string>

namespace tollgate {

// Prints `prompt` to stderr and reads one line from `fd` with terminal echo
// disabled when `fd` is a tty. Throws EngineError(PROMPT_CANCELLED) on EOF.
std::string prompt_password(const std::string& prompt, int fd = 0);

}
