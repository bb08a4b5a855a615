#pragma once

#include <spdlog/spdlog.h>

#include <memory>

/** The logger shared by all binomix components (thread safe, colored output to stdout). */
std::shared_ptr<spdlog::logger> logger();
