#include "TFTPServer.hpp"
#include "TFTPFileServer.hpp"
#include "TFTPLog.hpp"
#include "TFTPOptions.hpp"

#include <csignal>
#include <iostream>
#include <boost/bind/bind.hpp>


int main(int argc, char **argv) {
  TFTPServerOptions options;
  try{
    options = parse_server_options(argc, argv);
  }catch(const std::exception& e){
    std::cerr << e.what() << std::endl;
    return 2;
  }
  if(options.help){
    std::cout << options.usage << std::endl;
    return 0;
  }

  try{
    init_logging(options.log_level);

    boost::asio::io_service io_service;
    TFTPFileServer files(io_service, options.root, options.workers, options.allow_write);
    boost::asio::ip::udp::endpoint listen_endpoint(boost::asio::ip::address::from_string(options.address), options.port);
    TFTPServer server(io_service, listen_endpoint, files, options.transfer);

    //Stop listening on SIGINT/SIGTERM, running transfers are closed
    boost::asio::signal_set signals(io_service, SIGINT, SIGTERM);
    signals.async_wait(boost::bind(&TFTPServer::stop, &server));

    server.start();
    io_service.run();
  }catch(const std::exception& e){
    BOOST_LOG_TRIVIAL(fatal) << e.what();
    return 1;
  }

  BOOST_LOG_TRIVIAL(info) << "done!";
  return 0;
}
