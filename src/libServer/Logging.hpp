#pragma once

#include "Logger/Logger.hpp"

namespace wordgame::server {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace wordgame::server
