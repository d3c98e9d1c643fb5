#include "paths.h"
#include <cstdlib>
#include <string>

#include <sys/stat.h>
#include <sys/types.h>
#include <errno.h>

namespace tollgate {

static bool is_dir(const std::string& p){
    struct stat st;
    return stat(p.c_str(), &st)==0 && S_ISDIR(st.st_mode);
}

bool ensure_dir(const std::string& p){
    if(p.empty()) return false;
    if(is_dir(p)) return true;
    size_t pos = 0;
    while(true){
        pos = p.find('/', pos + 1);
        const std::string part = p.substr(0, pos);
        if(!part.empty() && !is_dir(part)){
            if(mkdir(part.c_str(), 0700)!=0 && errno!=EEXIST) return false;
        }
        if(pos==std::string::npos) break;
    }
    return is_dir(p);
}

std::string join_path(const std::string& a, const std::string& b){
    if(a.empty()) return b;
    if(a.back()=='/') return a+b;
    return a + '/' + b;
}

std::string default_data_dir(){
    const char* env = std::getenv("TOLLGATE_HOME");
    if(env && *env) return std::string(env);
    const char* home = std::getenv("HOME");
    std::string base = (home && *home) ? std::string(home) : std::string(".");
    return join_path(base, ".tollgate");
}

}
