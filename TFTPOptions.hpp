#ifndef _TFTP_OPTIONS_HPP
#define _TFTP_OPTIONS_HPP

#include <string>
#include <cstddef>

#include "TFTPConfig.hpp"

struct TFTPServerOptions{
  TFTPServerOptions() : address("0.0.0.0"), port(69), root("."), workers(2), allow_write(false),
                        log_level("info"), help(false) {}

  std::string address;
  unsigned short port;
  std::string root;
  std::size_t workers;
  bool allow_write;
  std::string log_level;
  TFTPTransferConfig transfer;

  //Set when --help was given, usage then holds the option description
  bool help;
  std::string usage;
};

struct TFTPClientOptions{
  TFTPClientOptions() : port("69"), log_level("info"), help(false) {}

  std::string host;
  std::string port;
  std::string command;
  std::string remote_file;
  std::string local_file;
  std::string log_level;
  TFTPTransferConfig transfer;

  bool help;
  std::string usage;
};

/**
 * @brief Read the server options from the command line and an optional --config file
 * Values on the command line win over the config file. Throws
 * boost::program_options::error on syntax errors and std::invalid_argument
 * on values that make no sense.
 */
TFTPServerOptions parse_server_options(int argc, const char* const argv[]);

/**
 * @brief Same for the client: tftp-client [options] get|put <remote> [local]
 * The local file defaults to the remote name.
 */
TFTPClientOptions parse_client_options(int argc, const char* const argv[]);

#endif
