#ifndef _TFTP_SERVER_HPP
#define _TFTP_SERVER_HPP

#include <array>
#include <list>
#include <memory>
#include <string>
#include <functional>
#include <cstdint>
#include <boost/asio.hpp>

#include "TFTPConfig.hpp"
#include "TFTPPacket.hpp"
#include "TFTPTransfer.hpp"

class TFTPTransferSocket;

/**
 * @brief Answer to a read request
 * An accepted read carries the complete file content.
 */
struct TFTPReadDecision{
  TFTPReadDecision() : accepted(false), error_code(TFTP_ERROR_NOT_DEFINED) {}

  static TFTPReadDecision accept(const TFTPBuffer& aData,
                                 std::shared_ptr<TFTPTransferHandler> aHandler = std::shared_ptr<TFTPTransferHandler>());
  static TFTPReadDecision reject(std::uint16_t aCode, const std::string& aReason = std::string());

  bool accepted;
  TFTPBuffer data;
  std::uint16_t error_code;
  std::string reason;
  std::shared_ptr<TFTPTransferHandler> handler;
};

/**
 * @brief Answer to a write request
 * The handler of an accepted write receives the uploaded blocks.
 */
struct TFTPWriteDecision{
  TFTPWriteDecision() : accepted(false), error_code(TFTP_ERROR_NOT_DEFINED) {}

  static TFTPWriteDecision accept(std::shared_ptr<TFTPTransferHandler> aHandler);
  static TFTPWriteDecision reject(std::uint16_t aCode, const std::string& aReason = std::string());

  bool accepted;
  std::uint16_t error_code;
  std::string reason;
  std::shared_ptr<TFTPTransferHandler> handler;
};

/**
 * @brief Application side of the server
 * Each request is offered exactly once. The reply may be called later, for
 * example after a worker read the file, but it has to be called on the thread
 * running the io_service and while the TFTPServer still exists.
 */
class TFTPServerHandler{
public:
  typedef std::function<void(const TFTPReadDecision&)> ReadReply;
  typedef std::function<void(const TFTPWriteDecision&)> WriteReply;

  virtual ~TFTPServerHandler() {}

  virtual void accept_read(const boost::asio::ip::udp::endpoint& peer, const std::string& filename, ReadReply reply) = 0;
  virtual void accept_put(const boost::asio::ip::udp::endpoint& peer, const std::string& filename, WriteReply reply) = 0;

  //A datagram on the listening port that could not be decoded
  virtual void on_malformed_request(const boost::asio::ip::udp::endpoint& peer, const std::string& message) {}
};

/**
 * @brief Listens on the well known port and hands every accepted request to
 * its own transfer socket
 */
class TFTPServer{
public:
  /**
   * Throws boost::system::system_error when the listening endpoint cannot be bound.
   */
  TFTPServer(boost::asio::io_service& aIoService, const boost::asio::ip::udp::endpoint& aListenEndpoint,
             TFTPServerHandler& aHandler, const TFTPTransferConfig& aConfig = TFTPTransferConfig());
  TFTPServer(const TFTPServer& obj) = delete;
  ~TFTPServer();

  void start();

  /**
   * @brief Stop listening and close every running transfer
   */
  void stop();

  boost::asio::ip::udp::endpoint local_endpoint() const;

  //Transfers that have not reached a terminal state yet
  std::size_t active_transfers() const { return transfers.size(); }

private:
  void receive_request();
  void handle_request(const boost::system::error_code& error, std::size_t bytes_transfered);

  void handle_rrq(const boost::asio::ip::udp::endpoint& peer, const TFTPPacket& packet);
  void handle_wrq(const boost::asio::ip::udp::endpoint& peer, const TFTPPacket& packet);

  void read_decided(boost::asio::ip::udp::endpoint peer, std::string filename, const TFTPReadDecision& decision);
  void write_decided(boost::asio::ip::udp::endpoint peer, std::string filename, const TFTPWriteDecision& decision);

  void spawn_transfer(std::shared_ptr<TFTPTransferSocket> transfer_socket, std::unique_ptr<TFTPTransfer> transfer);
  void forget_transfer(const TFTPTransferSocket* transfer_socket);
  void send_error(const boost::asio::ip::udp::endpoint& peer, std::uint16_t code, const std::string& message);

  boost::asio::io_service& io_service;
  boost::asio::ip::udp::socket sock;
  boost::asio::ip::udp::endpoint sender_endpoint;
  std::array<unsigned char, TFTP_MAX_PACKET_SIZE + 1> rx_buffer;
  TFTPServerHandler& handler;
  TFTPTransferConfig config;
  //Sockets remove themselves once their transfer ended
  std::list<std::weak_ptr<TFTPTransferSocket> > transfers;
  bool running;
};

#endif
