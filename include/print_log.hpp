#ifndef PRINT_LOG_HPP
#define PRINT_LOG_HPP

#include "print_log/core/log_common.hpp"
#include "print_log/core/severity.hpp"
#include "print_log/core/time_zone.hpp"
#include "print_log/core/color_table.hpp"
#include "print_log/core/encoding.hpp"
#include "print_log/core/print_policy.hpp"
#include "print_log/core/log_directory.hpp"
#include "print_log/format/line_formatter.hpp"
#include "print_log/channel/rotating_file_channel.hpp"
#include "print_log/print_options.hpp"
#include "print_log/printer.hpp"
#include "print_log/capture/error_stream_capture.hpp"

#endif // PRINT_LOG_HPP
