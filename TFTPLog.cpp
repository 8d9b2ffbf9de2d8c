#include "TFTPLog.hpp"

#include <iostream>
#include <stdexcept>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>


boost::log::trivial::severity_level parse_log_level(const std::string& level)
{
  boost::log::trivial::severity_level severity;
  if(!boost::log::trivial::from_string(level.c_str(), level.size(), severity)){
    throw std::invalid_argument("Unknown log level: " + level);
  }
  return severity;
}

void set_log_level(const std::string& level)
{
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= parse_log_level(level));
}

void init_logging(const std::string& level)
{
  set_log_level(level);

  boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");
  boost::log::add_common_attributes();
  boost::log::add_console_log(std::clog, boost::log::keywords::format = "[%TimeStamp%] [%Severity%] %Message%");
}
