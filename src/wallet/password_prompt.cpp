#include "wallet/password_prompt.h"
#include "errors.h"
#include "crypto/secure_random.h"

#include <cerrno>
#include <iostream>

#include <termios.h>
#include <unistd.h>

namespace tollgate {

namespace {

// Restores the terminal on every exit path.
class EchoOff {
public:
    explicit EchoOff(int fd) : fd_(fd) {
        if (isatty(fd_) && tcgetattr(fd_, &old_) == 0) {
            termios t = old_;
            t.c_lflag &= ~ECHO;
            active_ = tcsetattr(fd_, TCSANOW, &t) == 0;
        }
    }
    ~EchoOff() {
        if (active_) tcsetattr(fd_, TCSANOW, &old_);
    }
    EchoOff(const EchoOff&) = delete;
    EchoOff& operator=(const EchoOff&) = delete;

private:
    int fd_;
    termios old_{};
    bool active_{false};
};

}

std::string prompt_password(const std::string& prompt, int fd) {
    std::cerr << prompt << std::flush;
    std::string pass;
    {
        EchoOff guard(fd);
        char c;
        for (;;) {
            ssize_t n = ::read(fd, &c, 1);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                secure_wipe(pass);
                std::cerr << "\n";
                throw EngineError(ErrorCode::PROMPT_CANCELLED, "Password prompt cancelled");
            }
            if (c == '\n') break;
            if (c == '\r') continue;
            pass.push_back(c);
        }
    }
    std::cerr << "\n";
    return pass;
}

}
