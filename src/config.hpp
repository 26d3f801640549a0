#pragma once

#include <string>

struct ServiceConfig {
    std::string data_root;   // LOCAL_DATA_PATH, absolute
    std::string index_dir;   // <data_root>/index
    std::string host = "127.0.0.1";
    int port = 8008;
};

// Reads LOCAL_DATA_PATH from the environment.
// Throws ConfigError if it is unset or blank.
ServiceConfig load_config_from_env();

// Same as above with the raw value already fetched; nullptr means unset.
ServiceConfig make_config(const char* local_data_path);
