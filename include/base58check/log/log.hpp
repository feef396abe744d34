#pragma once

#include <quill/core/LogLevel.h>
#include <quill/LogMacros.h>

#include <base58check/log/formatter.hpp>
#include <base58check/log/frontend.hpp>

namespace base58check::log {

// Starts the logging backend and sets the level of the root logger
void initialize( quill::LogLevel level = quill::LogLevel::Info ) noexcept;
logger* instance() noexcept;

} // namespace base58check::log
