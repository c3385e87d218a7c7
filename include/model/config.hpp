#pragma once

#include <string>
#include <vector>

#include "model/pipe_spec.hpp"

constexpr const char* kDefaultConfigPath = "/etc/logpipe.conf";

struct Config {
    std::string configPath{kDefaultConfigPath};
    std::string syslogSocket;  // empty: try the usual local endpoints
    std::vector<PipeSpec> pipes;
};
