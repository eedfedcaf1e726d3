#include <lootwatch/app/logging.hpp>
#include <opencv2/core/utils/logger.hpp>

namespace lootwatch::app {

namespace logging = cv::utils::logging;

bool configure_logging(std::string_view level) {
  logging::LogLevel parsed = logging::LOG_LEVEL_INFO;
  if (level == "silent") parsed = logging::LOG_LEVEL_SILENT;
  else if (level == "fatal") parsed = logging::LOG_LEVEL_FATAL;
  else if (level == "error") parsed = logging::LOG_LEVEL_ERROR;
  else if (level == "warning") parsed = logging::LOG_LEVEL_WARNING;
  else if (level == "info") parsed = logging::LOG_LEVEL_INFO;
  else if (level == "debug") parsed = logging::LOG_LEVEL_DEBUG;
  else if (level == "verbose") parsed = logging::LOG_LEVEL_VERBOSE;
  else return false;

  logging::setLogLevel(parsed);
  return true;
}

}  // namespace lootwatch::app
