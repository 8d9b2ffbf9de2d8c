#ifndef _TFTP_TRANSFER_SOCKET_HPP
#define _TFTP_TRANSFER_SOCKET_HPP

#include <array>
#include <functional>
#include <memory>
#include <boost/asio.hpp>

#include "TFTPTransfer.hpp"

/**
 * @brief UDP socket dedicated to a single transfer
 * The socket is bound to an ephemeral port, so its port is our half of the
 * transfer ID. It owns the transfer and keeps itself alive through its pending
 * receive until the transfer ends, at which point it closes.
 */
class TFTPTransferSocket : public TFTPPacketSink, public std::enable_shared_from_this<TFTPTransferSocket>{
public:
  typedef std::function<void()> ClosedHandler;

  /**
   * @brief Open a socket on an ephemeral port of local_address
   * Throws boost::system::system_error if the socket cannot be opened or bound.
   */
  TFTPTransferSocket(boost::asio::io_service& aIoService, const boost::asio::ip::address& aLocalAddress);
  TFTPTransferSocket(const TFTPTransferSocket& obj) = delete;
  ~TFTPTransferSocket();

  //The transfer is built against this socket, attach it before start()
  void attach(std::unique_ptr<TFTPTransfer> aTransfer);

  /**
   * @brief Send the opening packet of the transfer and start receiving
   */
  void start();

  /**
   * @brief Tear the transfer down
   * A transfer that is still running reports "Connection closed" to its handler.
   */
  void close();

  //Called once, right after the socket closed
  void set_closed_handler(ClosedHandler aHandler) { closed_handler = aHandler; }

  void send_packet(const boost::asio::ip::udp::endpoint& peer, const TFTPBuffer& packet) override;

  bool is_open() const { return !closed; }
  boost::asio::ip::udp::endpoint local_endpoint() const;
  TFTPTransfer& transfer() { return *session; }

private:
  void receive_next();
  void handle_receive(const boost::system::error_code& error, std::size_t bytes_transfered);
  void close_socket();

  boost::asio::ip::udp::socket sock;
  boost::asio::ip::udp::endpoint sender_endpoint;
  //One byte more than the largest packet so oversized datagrams are noticed
  std::array<unsigned char, TFTP_MAX_PACKET_SIZE + 1> rx_buffer;
  std::unique_ptr<TFTPTransfer> session;
  ClosedHandler closed_handler;
  bool closed;
};

#endif
