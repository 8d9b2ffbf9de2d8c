#include "TFTPReceiveTransfer.hpp"

#include <stdexcept>
#include <boost/log/trivial.hpp>


TFTPReceiveTransfer::TFTPReceiveTransfer(boost::asio::io_service& aIoService, TFTPPacketSink& aSink, TFTPRole aRole,
                                         const boost::asio::ip::udp::endpoint& aPeer,
                                         std::shared_ptr<TFTPTransferHandler> aHandler,
                                         const TFTPTransferConfig& aConfig, const std::string& aRemoteFile) :
      TFTPTransfer(aIoService, aSink, aRole, aPeer, aHandler, aConfig), remote_file(aRemoteFile)
{
  if(aRole != TFTPRole::CLIENT_DOWNLOAD && aRole != TFTPRole::SERVER_DOWNLOAD){
    throw std::invalid_argument("A receive transfer is either a client or a server download");
  }
  block = 1;
}

void TFTPReceiveTransfer::start()
{
  transfer_phase = TFTPTransferPhase::AWAITING_HANDSHAKE;
  if(is_client()){
    BOOST_LOG_TRIVIAL(info) << "Requesting " << remote_file << " from " << peer();
    send_packet(encode_request(TFTPOpcode::RRQ, remote_file));
  }else{
    //Accept the WRQ, the client answers with DATA(1)
    send_packet(encode_ack(0));
  }
}

//Protected
void TFTPReceiveTransfer::handle_data(const TFTPPacket& packet)
{
  if(packet.block != block){
    BOOST_LOG_TRIVIAL(debug) << "Ignoring DATA block " << packet.block << " from " << peer()
                             << ", expecting " << block;
    return;
  }

  disarm_timer();
  transfer_phase = TFTPTransferPhase::TRANSFERRING;
  if(!packet.data.empty()){
    TFTPBlockDecision decision = handler().on_block(packet.data);
    if(!decision.accepted){
      abort(decision.error_code, decision.reason.empty() ? tftp_error_message(decision.error_code) : decision.reason);
      return;
    }
  }

  if(packet.data.size() < TFTP_BLOCK_SIZE){
    //The sender does not acknowledge our last ACK, so it is not retransmitted
    send_packet(encode_ack(block), false);
    finish();
    return;
  }

  if(block == 0xffff){
    abort(TFTP_ERROR_DISK_FULL, "File exceeds the TFTP block number range");
    return;
  }

  send_packet(encode_ack(block));
  ++block;
}
