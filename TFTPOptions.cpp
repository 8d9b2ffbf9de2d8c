#include "TFTPOptions.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <boost/program_options.hpp>

namespace po = boost::program_options;


namespace {

struct TransferSettings{
  TransferSettings() : timeout_ms(1500), max_timeout_ms(12000), no_final_ack_wait(false) {}

  unsigned int timeout_ms;
  unsigned int max_timeout_ms;
  bool no_final_ack_wait;
  std::string config_file;
};

void add_common_options(po::options_description& desc, TransferSettings& settings, std::string& log_level)
{
  desc.add_options()
    ("help,h", "show this help")
    ("config,c", po::value<std::string>(&settings.config_file), "read further options from this file")
    ("log-level", po::value<std::string>(&log_level)->default_value("info"),
     "trace, debug, info, warning, error or fatal")
    ("timeout-ms", po::value<unsigned int>(&settings.timeout_ms)->default_value(1500),
     "first retransmission timeout, doubled on every retransmission")
    ("max-timeout-ms", po::value<unsigned int>(&settings.max_timeout_ms)->default_value(12000),
     "give up once the retransmission timeout grows beyond this")
    ("no-final-ack-wait", po::bool_switch(&settings.no_final_ack_wait),
     "finish an upload right after sending the last block");
}

//Parses the command line, then the config file if one was named
void parse(int argc, const char* const argv[], const po::options_description& desc,
           const po::positional_options_description& positional, po::variables_map& vm)
{
  po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);

  if(vm.count("config")){
    std::string path = vm["config"].as<std::string>();
    std::ifstream config_file(path);
    if(!config_file.is_open()){
      throw std::invalid_argument("Cant open config file: " + path);
    }
    po::store(po::parse_config_file(config_file, desc), vm);
  }
  po::notify(vm);
}

TFTPTransferConfig make_transfer_config(const TransferSettings& settings)
{
  if(settings.timeout_ms == 0){
    throw std::invalid_argument("timeout-ms must be greater than 0");
  }
  if(settings.max_timeout_ms < settings.timeout_ms){
    throw std::invalid_argument("max-timeout-ms must not be smaller than timeout-ms");
  }

  TFTPTransferConfig config;
  config.base_timeout = boost::posix_time::millisec(settings.timeout_ms);
  config.max_timeout = boost::posix_time::millisec(settings.max_timeout_ms);
  config.await_final_ack = !settings.no_final_ack_wait;
  return config;
}

std::string usage_of(const po::options_description& desc)
{
  std::ostringstream out;
  out << desc;
  return out.str();
}

} // namespace


TFTPServerOptions parse_server_options(int argc, const char* const argv[])
{
  TFTPServerOptions options;
  TransferSettings settings;

  po::options_description desc("tftp-server options");
  desc.add_options()
    ("address,a", po::value<std::string>(&options.address)->default_value(options.address), "address to listen on")
    ("port,p", po::value<unsigned short>(&options.port)->default_value(options.port), "UDP port to listen on")
    ("root,r", po::value<std::string>(&options.root)->default_value(options.root), "directory to serve")
    ("workers", po::value<std::size_t>(&options.workers)->default_value(options.workers),
     "threads reading and writing files")
    ("allow-write", po::bool_switch(&options.allow_write), "accept uploads (WRQ)");
  add_common_options(desc, settings, options.log_level);

  po::variables_map vm;
  parse(argc, argv, desc, po::positional_options_description(), vm);

  if(vm.count("help")){
    options.help = true;
    options.usage = usage_of(desc);
    return options;
  }

  if(options.workers == 0){
    throw std::invalid_argument("workers must be greater than 0");
  }
  options.transfer = make_transfer_config(settings);
  return options;
}

TFTPClientOptions parse_client_options(int argc, const char* const argv[])
{
  TFTPClientOptions options;
  TransferSettings settings;

  po::options_description desc("tftp-client [options] get|put <remote file> [local file]");
  desc.add_options()
    ("host,H", po::value<std::string>(&options.host), "TFTP server")
    ("port,p", po::value<std::string>(&options.port)->default_value(options.port), "TFTP server port")
    ("command", po::value<std::string>(&options.command), "get or put")
    ("remote", po::value<std::string>(&options.remote_file), "file name on the server")
    ("local", po::value<std::string>(&options.local_file), "local file, defaults to the remote name");
  add_common_options(desc, settings, options.log_level);

  po::positional_options_description positional;
  positional.add("command", 1).add("remote", 1).add("local", 1);

  po::variables_map vm;
  parse(argc, argv, desc, positional, vm);

  if(vm.count("help")){
    options.help = true;
    options.usage = usage_of(desc);
    return options;
  }

  if(options.host.empty()){
    throw std::invalid_argument("No server given, use --host");
  }
  if(options.command != "get" && options.command != "put"){
    throw std::invalid_argument("Command must be get or put, not '" + options.command + "'");
  }
  if(options.remote_file.empty()){
    throw std::invalid_argument("No remote file given");
  }
  if(options.local_file.empty()){
    std::string::size_type slash = options.remote_file.find_last_of('/');
    options.local_file = slash == std::string::npos ? options.remote_file : options.remote_file.substr(slash + 1);
  }

  options.transfer = make_transfer_config(settings);
  return options;
}
