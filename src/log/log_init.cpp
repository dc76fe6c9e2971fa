//! # Log Initialization from the Environment
//!
//! deadprop has no command line of its own; hosts configure logging either
//! through `Logger::init()` or the DEADPROP_LOG environment variable.

#include "log/log.hpp"

#include <cstdlib>
#include <string>

namespace deadprop::log {

LogConfig log_config_from_env() {
    LogConfig config;

    std::string env_str;
#ifdef _WIN32
    char* env_buf = nullptr;
    size_t env_len = 0;
    if (_dupenv_s(&env_buf, &env_len, "DEADPROP_LOG") == 0 && env_buf) {
        env_str = env_buf;
        free(env_buf);
    }
#else
    const char* env_log = std::getenv("DEADPROP_LOG");
    if (env_log) {
        env_str = env_log;
    }
#endif
    if (env_str.empty()) {
        return config;
    }

    // "lint=trace,*=warn" and "lint,pass" are filter specs; anything else is a level
    if (env_str.find('=') != std::string::npos || env_str.find(',') != std::string::npos) {
        config.filter_spec = env_str;
    } else {
        config.level = parse_level(env_str);
    }

    return config;
}

} // namespace deadprop::log
