#ifndef _TFTP_TRANSFER_HPP
#define _TFTP_TRANSFER_HPP

#include <string>
#include <memory>
#include <functional>
#include <cstdint>
#include <boost/asio.hpp>

#include "TFTPConfig.hpp"
#include "TFTPPacket.hpp"
#include "TFTPRetransmissionTimer.hpp"

/**
 * @brief Answer of a handler to a received block
 * A rejected block aborts the transfer, the peer gets an ERROR with the given
 * code and reason (the canned text when the reason is empty).
 */
struct TFTPBlockDecision{
  TFTPBlockDecision() : accepted(true), error_code(TFTP_ERROR_NOT_DEFINED) {}

  static TFTPBlockDecision accept();
  static TFTPBlockDecision reject(std::uint16_t aCode, const std::string& aReason = std::string());

  bool accepted;
  std::uint16_t error_code;
  std::string reason;
};

/**
 * @brief Application side of one transfer
 * Exactly one of on_complete or on_failed is called per transfer.
 */
class TFTPTransferHandler{
public:
  virtual ~TFTPTransferHandler() {}

  //A received, non-empty DATA block in order
  virtual TFTPBlockDecision on_block(const TFTPBuffer& block) { return TFTPBlockDecision::accept(); }
  virtual void on_complete() {}
  virtual void on_failed(const std::string& message) {}
};

/**
 * @brief Where a transfer puts its outgoing datagrams
 */
class TFTPPacketSink{
public:
  virtual ~TFTPPacketSink() {}
  virtual void send_packet(const boost::asio::ip::udp::endpoint& peer, const TFTPBuffer& packet) = 0;
};

enum class TFTPTransferPhase{
  AWAITING_HANDSHAKE,
  TRANSFERRING,
  TERMINAL
};

enum class TFTPDirection{
  SEND,
  RECEIVE
};

enum class TFTPRole{
  CLIENT_DOWNLOAD,
  CLIENT_UPLOAD,
  SERVER_DOWNLOAD,
  SERVER_UPLOAD
};

/**
 * @brief State shared by all four transfer roles
 * All events enter through handle(), handle_failure() or the retransmission timer.
 * Once the transfer is terminal every later event is ignored.
 */
class TFTPTransfer{
public:
  typedef std::function<void()> TerminatedHandler;

  TFTPTransfer(boost::asio::io_service& aIoService, TFTPPacketSink& aSink, TFTPRole aRole,
               const boost::asio::ip::udp::endpoint& aPeer,
               std::shared_ptr<TFTPTransferHandler> aHandler, const TFTPTransferConfig& aConfig);
  TFTPTransfer(const TFTPTransfer& obj) = delete;
  virtual ~TFTPTransfer();

  /**
   * @brief Send the packet that opens this role
   * RRQ or WRQ for clients, ACK(0) or DATA(1) for the server side.
   */
  virtual void start() = 0;

  //Inbound packet from the peer, dispatched on the opcode
  void handle(const TFTPPacket& packet);

  //Peer ERROR packet or an undecodable datagram, ends the transfer without a reply
  void handle_failure(const std::string& message);

  /**
   * @brief Give up on the transfer
   * Sends one ERROR packet to the peer and reports the failure to the handler.
   */
  void abort(std::uint16_t code, const std::string& message);

  /**
   * @brief Transfer ID check for an inbound datagram
   * The address must always match. A client does not know the port the server
   * answers from, the first datagram from the right address fixes it.
   */
  bool accepts_datagram_from(const boost::asio::ip::udp::endpoint& sender);

  void set_terminated_handler(TerminatedHandler aHandler) { terminated_handler = aHandler; }

  virtual TFTPDirection direction() const = 0;
  TFTPRole role() const { return transfer_role; }
  TFTPTransferPhase phase() const { return transfer_phase; }
  bool is_terminal() const { return transfer_phase == TFTPTransferPhase::TERMINAL; }
  std::uint16_t block_number() const { return block; }
  const boost::asio::ip::udp::endpoint& peer() const { return peer_endpoint; }
  bool peer_port_resolved() const { return port_resolved; }
  const TFTPRetransmissionTimer& timer() const { return retransmission_timer; }

protected:
  virtual void handle_rrq(const TFTPPacket& packet);
  virtual void handle_wrq(const TFTPPacket& packet);
  virtual void handle_data(const TFTPPacket& packet);
  virtual void handle_ack(const TFTPPacket& packet);

  //Send to the peer, arming the retransmission timer unless told otherwise
  void send_packet(const TFTPBuffer& packet, bool arm_timer = true);
  void disarm_timer();
  void finish();
  void fail(const std::string& message);
  void protocol_violation(const TFTPPacket& packet);

  bool is_client() const;

  TFTPTransferHandler& handler() { return *transfer_handler; }

  std::uint16_t block;
  TFTPTransferPhase transfer_phase;
  const TFTPTransferConfig config;

private:
  void handle_timeout();
  void terminate();

  TFTPPacketSink& sink;
  TFTPRole transfer_role;
  boost::asio::ip::udp::endpoint peer_endpoint;
  bool port_resolved;
  std::shared_ptr<TFTPTransferHandler> transfer_handler;
  TFTPRetransmissionTimer retransmission_timer;
  TerminatedHandler terminated_handler;
};

#endif
