#pragma once

#include "core/config.h"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace easel {

// Installs the default logger: colored stderr plus an optional file sink.
void init_logging(const LoggingConfig& config);

namespace log {

// Named logger sharing the default logger's sinks; created on first use.
std::shared_ptr<spdlog::logger> get(const std::string& name);

}

}
