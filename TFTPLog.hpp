#ifndef _TFTP_LOG_HPP
#define _TFTP_LOG_HPP

#include <string>
#include <boost/log/trivial.hpp>

/**
 * @brief Parse a severity name (trace, debug, info, warning, error, fatal)
 * Throws std::invalid_argument for anything else.
 */
boost::log::trivial::severity_level parse_log_level(const std::string& level);

//Only let records of at least this severity through
void set_log_level(const std::string& level);

/**
 * @brief Log to std::clog as "[time] [severity] message"
 */
void init_logging(const std::string& level);

#endif
