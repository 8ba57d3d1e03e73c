#pragma once

#include "Logger/Logger.hpp"

namespace flyff::bot {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace flyff::bot
