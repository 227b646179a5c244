#pragma once

#include "Logger/Logger.hpp"

namespace wordgame::network {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace wordgame::network
