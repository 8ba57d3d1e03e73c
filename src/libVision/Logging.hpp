#pragma once

#include "Logger/Logger.hpp"

namespace flyff::vision {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace flyff::vision
