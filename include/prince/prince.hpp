#ifndef PRINCE_PRINCE_HPP
#define PRINCE_PRINCE_HPP

#include "errors.hpp"
#include "log.hpp"
#include "escape.hpp"
#include "messages.hpp"
#include "options.hpp"
#include "command_line.hpp"
#include "popen3.hpp"
#include "log_parser.hpp"
#include "stream_pump.hpp"
#include "converter.hpp"

#endif // PRINCE_PRINCE_HPP
