#include "TFTPSendTransfer.hpp"

#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>


TFTPSendTransfer::TFTPSendTransfer(boost::asio::io_service& aIoService, TFTPPacketSink& aSink, TFTPRole aRole,
                                   const boost::asio::ip::udp::endpoint& aPeer,
                                   std::shared_ptr<TFTPTransferHandler> aHandler, const TFTPTransferConfig& aConfig,
                                   const TFTPBuffer& aData, const std::string& aRemoteFile) :
      TFTPTransfer(aIoService, aSink, aRole, aPeer, aHandler, aConfig),
      buffer(aData), cursor(0), last_block_sent(false), remote_file(aRemoteFile)
{
  if(aRole != TFTPRole::CLIENT_UPLOAD && aRole != TFTPRole::SERVER_UPLOAD){
    throw std::invalid_argument("A send transfer is either a client or a server upload");
  }
  if(buffer.size() > TFTP_MAX_TRANSFER_SIZE){
    throw std::length_error("File of " + std::to_string(buffer.size()) + " bytes exceeds the TFTP block number range");
  }
}

void TFTPSendTransfer::start()
{
  if(is_client()){
    //DATA only flows after the server acknowledged the WRQ with ACK(0)
    BOOST_LOG_TRIVIAL(info) << "Sending " << remote_file << " (" << buffer.size() << " bytes) to " << peer();
    block = 0;
    transfer_phase = TFTPTransferPhase::AWAITING_HANDSHAKE;
    send_packet(encode_request(TFTPOpcode::WRQ, remote_file));
  }else{
    block = 1;
    transfer_phase = TFTPTransferPhase::TRANSFERRING;
    send_block();
  }
}

//Protected
void TFTPSendTransfer::handle_ack(const TFTPPacket& packet)
{
  if(packet.block != block){
    BOOST_LOG_TRIVIAL(debug) << "Ignoring ACK " << packet.block << " from " << peer() << ", expecting " << block;
    return;
  }

  disarm_timer();
  if(last_block_sent){
    finish();
    return;
  }

  ++block;
  transfer_phase = TFTPTransferPhase::TRANSFERRING;
  send_block();
}

//Private
void TFTPSendTransfer::send_block()
{
  std::size_t chunk = std::min(TFTP_BLOCK_SIZE, buffer.size() - cursor);
  TFTPBuffer packet = encode_data(block, buffer.data() + cursor, chunk);
  cursor += chunk;

  //A short block, possibly empty, tells the receiver this is the end
  if(chunk < TFTP_BLOCK_SIZE){
    last_block_sent = true;
    if(!config.await_final_ack){
      send_packet(packet, false);
      finish();
      return;
    }
  }
  send_packet(packet);
}
