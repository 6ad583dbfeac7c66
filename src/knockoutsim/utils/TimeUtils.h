#pragma once

#include <string>

namespace knockoutsim
{
namespace utils
{

/**
 * @brief Get current timestamp as a formatted string for file names
 * @return Timestamp in format "Mon_DD_YYYY_HHMM"
 */
std::string getCurrentTimestamp();

} // namespace utils
} // namespace knockoutsim
