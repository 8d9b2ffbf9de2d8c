#ifndef _TFTP_CLIENT_HPP
#define _TFTP_CLIENT_HPP

#include <string>
#include <functional>
#include <boost/asio.hpp>

#include "TFTPConfig.hpp"
#include "TFTPPacket.hpp"

/**
 * @brief Outcome of a client transfer
 * data holds the downloaded file for a successful read, error the reason of a failure.
 */
struct TFTPResult{
  TFTPResult() : success(false) {}

  bool success;
  TFTPBuffer data;
  std::string error;
};

class TFTPClient{
public:
  typedef std::function<void(const TFTPResult&)> ResultHandler;

  /**
   * @brief Resolve the server, throws boost::system::system_error if that fails
   */
  TFTPClient(boost::asio::io_service& aIoService, std::string aHost, std::string aPort = "69",
             const TFTPTransferConfig& aConfig = TFTPTransferConfig());
  TFTPClient(const TFTPClient& obj) = delete;

  /**
   * @brief Start receiving a file from the remote end
   * The callback is called exactly once, when the transfer has ended.
   */
  void read_file_async(const std::string& remote_file, ResultHandler callback);

  /**
   * @brief Start sending content to the remote end as remote_file
   * The callback is called exactly once, when the transfer has ended.
   */
  void write_file_async(const std::string& remote_file, const TFTPBuffer& content, ResultHandler callback);

  const boost::asio::ip::udp::endpoint& server() const { return server_endpoint; }

private:
  boost::asio::io_service& io_service;
  std::string host;
  boost::asio::ip::udp::endpoint server_endpoint;
  TFTPTransferConfig config;
};

#endif
