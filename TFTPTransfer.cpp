#include "TFTPTransfer.hpp"

#include <boost/bind/bind.hpp>
#include <boost/log/trivial.hpp>


TFTPBlockDecision TFTPBlockDecision::accept()
{
  return TFTPBlockDecision();
}

TFTPBlockDecision TFTPBlockDecision::reject(std::uint16_t aCode, const std::string& aReason)
{
  TFTPBlockDecision decision;
  decision.accepted = false;
  decision.error_code = aCode;
  decision.reason = aReason;
  return decision;
}


TFTPTransfer::TFTPTransfer(boost::asio::io_service& aIoService, TFTPPacketSink& aSink, TFTPRole aRole,
                           const boost::asio::ip::udp::endpoint& aPeer,
                           std::shared_ptr<TFTPTransferHandler> aHandler, const TFTPTransferConfig& aConfig) :
      block(0), transfer_phase(TFTPTransferPhase::AWAITING_HANDSHAKE), config(aConfig),
      sink(aSink), transfer_role(aRole), peer_endpoint(aPeer),
      port_resolved(aRole == TFTPRole::SERVER_DOWNLOAD || aRole == TFTPRole::SERVER_UPLOAD),
      transfer_handler(aHandler), retransmission_timer(aIoService, aConfig)
{
  if(!transfer_handler){
    transfer_handler = std::make_shared<TFTPTransferHandler>();
  }

  retransmission_timer.set_handlers(
    boost::bind(&TFTPTransfer::send_packet, this, boost::placeholders::_1, false),
    boost::bind(&TFTPTransfer::handle_timeout, this)
  );
}

TFTPTransfer::~TFTPTransfer()
{
}

void TFTPTransfer::handle(const TFTPPacket& packet)
{
  if(is_terminal()){
    BOOST_LOG_TRIVIAL(debug) << "Ignoring " << tftp_opcode_name(packet.opcode) << " on a finished transfer";
    return;
  }

  switch(packet.opcode){
  case TFTPOpcode::RRQ:
    handle_rrq(packet);
    break;
  case TFTPOpcode::WRQ:
    handle_wrq(packet);
    break;
  case TFTPOpcode::DATA:
    handle_data(packet);
    break;
  case TFTPOpcode::ACK:
    handle_ack(packet);
    break;
  case TFTPOpcode::ERR:
    //decode_packet throws for ERROR packets, kept for callers that build packets themselves
    handle_failure(packet.error_message.empty() ? tftp_error_message(packet.error_code) : packet.error_message);
    break;
  }
}

void TFTPTransfer::handle_failure(const std::string& message)
{
  if(is_terminal()) return;
  BOOST_LOG_TRIVIAL(warning) << "Transfer with " << peer_endpoint << " failed: " << message;
  fail(message);
}

void TFTPTransfer::abort(std::uint16_t code, const std::string& message)
{
  if(is_terminal()) return;

  BOOST_LOG_TRIVIAL(warning) << "Aborting transfer with " << peer_endpoint << " (error " << code << "): " << message;
  retransmission_timer.disarm();
  send_packet(encode_error(code, message), false);
  transfer_phase = TFTPTransferPhase::TERMINAL;
  handler().on_failed(message);
  terminate();
}

bool TFTPTransfer::accepts_datagram_from(const boost::asio::ip::udp::endpoint& sender)
{
  if(sender.address() != peer_endpoint.address()) return false;

  if(!port_resolved){
    peer_endpoint.port(sender.port());
    port_resolved = true;
    BOOST_LOG_TRIVIAL(debug) << "Transfer ID resolved to " << peer_endpoint;
    return true;
  }
  return sender.port() == peer_endpoint.port();
}

//Protected
void TFTPTransfer::handle_rrq(const TFTPPacket& packet)
{
  protocol_violation(packet);
}

//Protected
void TFTPTransfer::handle_wrq(const TFTPPacket& packet)
{
  protocol_violation(packet);
}

//Protected
void TFTPTransfer::handle_data(const TFTPPacket& packet)
{
  protocol_violation(packet);
}

//Protected
void TFTPTransfer::handle_ack(const TFTPPacket& packet)
{
  protocol_violation(packet);
}

//Protected
void TFTPTransfer::send_packet(const TFTPBuffer& packet, bool arm_timer)
{
  sink.send_packet(peer_endpoint, packet);
  if(arm_timer){
    retransmission_timer.arm(packet);
  }
}

//Protected
void TFTPTransfer::disarm_timer()
{
  retransmission_timer.disarm();
}

//Protected
void TFTPTransfer::finish()
{
  if(is_terminal()) return;

  BOOST_LOG_TRIVIAL(info) << "Transfer with " << peer_endpoint << " completed";
  retransmission_timer.disarm();
  transfer_phase = TFTPTransferPhase::TERMINAL;
  handler().on_complete();
  terminate();
}

//Protected
void TFTPTransfer::fail(const std::string& message)
{
  if(is_terminal()) return;

  retransmission_timer.disarm();
  transfer_phase = TFTPTransferPhase::TERMINAL;
  handler().on_failed(message);
  terminate();
}

//Protected
void TFTPTransfer::protocol_violation(const TFTPPacket& packet)
{
  BOOST_LOG_TRIVIAL(warning) << "Unexpected " << tftp_opcode_name(packet.opcode) << " from " << peer_endpoint
                             << " while " << (direction() == TFTPDirection::SEND ? "sending" : "receiving");
  abort(TFTP_ERROR_ILLEGAL_OPERATION, tftp_error_message(TFTP_ERROR_ILLEGAL_OPERATION));
}

//Protected
bool TFTPTransfer::is_client() const
{
  return transfer_role == TFTPRole::CLIENT_DOWNLOAD || transfer_role == TFTPRole::CLIENT_UPLOAD;
}

//Private
void TFTPTransfer::handle_timeout()
{
  BOOST_LOG_TRIVIAL(warning) << "Transfer with " << peer_endpoint << " timed out";
  fail("Timed out");
}

//Private
void TFTPTransfer::terminate()
{
  if(terminated_handler){
    TerminatedHandler done = terminated_handler;
    terminated_handler = nullptr;
    done();
  }
}
