#pragma once
#include <string>

namespace tollgate {

// $TOLLGATE_HOME, else $HOME/.tollgate. Not created.
std::string default_data_dir();

// mkdir -p, mode 0700 for created components.
bool ensure_dir(const std::string& path);

std::string join_path(const std::string& a, const std::string& b);

}
