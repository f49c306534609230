#include "roonlink/logging/roonlink_logging.hpp"

namespace roonlink
{
namespace logging
{

LogLevel current_log_level = LogLevel::Info;

} // namespace logging
} // namespace roonlink
