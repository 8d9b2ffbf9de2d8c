#include "TFTPServer.hpp"
#include "TFTPTransferSocket.hpp"
#include "TFTPSendTransfer.hpp"
#include "TFTPReceiveTransfer.hpp"

#include <boost/bind/bind.hpp>
#include <boost/log/trivial.hpp>


TFTPReadDecision TFTPReadDecision::accept(const TFTPBuffer& aData, std::shared_ptr<TFTPTransferHandler> aHandler)
{
  TFTPReadDecision decision;
  decision.accepted = true;
  decision.data = aData;
  decision.handler = aHandler;
  return decision;
}

TFTPReadDecision TFTPReadDecision::reject(std::uint16_t aCode, const std::string& aReason)
{
  TFTPReadDecision decision;
  decision.error_code = aCode;
  decision.reason = aReason;
  return decision;
}

TFTPWriteDecision TFTPWriteDecision::accept(std::shared_ptr<TFTPTransferHandler> aHandler)
{
  TFTPWriteDecision decision;
  decision.accepted = true;
  decision.handler = aHandler;
  return decision;
}

TFTPWriteDecision TFTPWriteDecision::reject(std::uint16_t aCode, const std::string& aReason)
{
  TFTPWriteDecision decision;
  decision.error_code = aCode;
  decision.reason = aReason;
  return decision;
}


TFTPServer::TFTPServer(boost::asio::io_service& aIoService, const boost::asio::ip::udp::endpoint& aListenEndpoint,
                       TFTPServerHandler& aHandler, const TFTPTransferConfig& aConfig) :
      io_service(aIoService), sock(aIoService), handler(aHandler), config(aConfig), running(false)
{
  sock.open(aListenEndpoint.protocol());
  sock.bind(aListenEndpoint);
}

TFTPServer::~TFTPServer()
{
  stop();
}

void TFTPServer::start()
{
  BOOST_LOG_TRIVIAL(info) << "TFTP server listening on " << local_endpoint();
  running = true;
  receive_request();
}

void TFTPServer::stop()
{
  if(!running) return;
  running = false;

  boost::system::error_code error;
  sock.close(error);
  if(error){
    BOOST_LOG_TRIVIAL(warning) << "Closing listening socket failed: " << error.message();
  }

  std::list<std::weak_ptr<TFTPTransferSocket> > running_transfers;
  running_transfers.swap(transfers);
  for(std::list<std::weak_ptr<TFTPTransferSocket> >::iterator it = running_transfers.begin();
      it != running_transfers.end(); ++it){
    std::shared_ptr<TFTPTransferSocket> transfer_socket = it->lock();
    if(transfer_socket) transfer_socket->close();
  }
}

boost::asio::ip::udp::endpoint TFTPServer::local_endpoint() const
{
  return sock.local_endpoint();
}

//Private
void TFTPServer::receive_request()
{
  sock.async_receive_from(
                            boost::asio::buffer(rx_buffer),
                            sender_endpoint,
                            boost::bind(
                              &TFTPServer::handle_request,
                              this,
                              boost::asio::placeholders::error,
                              boost::asio::placeholders::bytes_transferred
                            )
                          );
}

//Private
//Gets called for every datagram on the well known port
void TFTPServer::handle_request(const boost::system::error_code& error, std::size_t bytes_transfered)
{
  if(error == boost::asio::error::operation_aborted || !running) return;

  if(error){
    BOOST_LOG_TRIVIAL(warning) << "Receiving on the listening socket failed: " << error.message();
    receive_request();
    return;
  }

  boost::asio::ip::udp::endpoint peer = sender_endpoint;
  TFTPPacket packet;
  try{
    packet = decode_packet(rx_buffer.data(), bytes_transfered);
  }catch(const TFTPProtocolError& e){
    BOOST_LOG_TRIVIAL(warning) << "Malformed request from " << peer << ": " << e.what();
    handler.on_malformed_request(peer, e.what());
    receive_request();
    return;
  }

  switch(packet.opcode){
  case TFTPOpcode::RRQ:
    handle_rrq(peer, packet);
    break;
  case TFTPOpcode::WRQ:
    handle_wrq(peer, packet);
    break;
  case TFTPOpcode::DATA:
    //Nobody is expecting data on this port
    send_error(peer, TFTP_ERROR_UNKNOWN_TRANSFER_ID, tftp_error_message(TFTP_ERROR_UNKNOWN_TRANSFER_ID));
    break;
  case TFTPOpcode::ACK:
    BOOST_LOG_TRIVIAL(debug) << "Dropping stray ACK " << packet.block << " from " << peer;
    break;
  case TFTPOpcode::ERR:
    //Never decoded, ERROR packets end up in on_malformed_request above
    break;
  }

  if(running){
    receive_request();
  }
}

//Private
void TFTPServer::handle_rrq(const boost::asio::ip::udp::endpoint& peer, const TFTPPacket& packet)
{
  BOOST_LOG_TRIVIAL(info) << "RRQ for " << packet.filename << " (" << packet.mode << ") from " << peer;
  handler.accept_read(peer, packet.filename,
                      boost::bind(&TFTPServer::read_decided, this, peer, packet.filename, boost::placeholders::_1));
}

//Private
void TFTPServer::handle_wrq(const boost::asio::ip::udp::endpoint& peer, const TFTPPacket& packet)
{
  BOOST_LOG_TRIVIAL(info) << "WRQ for " << packet.filename << " (" << packet.mode << ") from " << peer;
  handler.accept_put(peer, packet.filename,
                     boost::bind(&TFTPServer::write_decided, this, peer, packet.filename, boost::placeholders::_1));
}

//Private
void TFTPServer::read_decided(boost::asio::ip::udp::endpoint peer, std::string filename, const TFTPReadDecision& decision)
{
  if(!running) return;

  if(!decision.accepted){
    BOOST_LOG_TRIVIAL(info) << "Refused read of " << filename << " by " << peer << " (error " << decision.error_code << ")";
    send_error(peer, decision.error_code,
               decision.reason.empty() ? tftp_error_message(decision.error_code) : decision.reason);
    return;
  }

  if(decision.data.size() > TFTP_MAX_TRANSFER_SIZE){
    BOOST_LOG_TRIVIAL(warning) << filename << " is too large for TFTP (" << decision.data.size() << " bytes)";
    send_error(peer, TFTP_ERROR_DISK_FULL, "File too large for TFTP");
    return;
  }

  try{
    std::shared_ptr<TFTPTransferSocket> transfer_socket =
        std::make_shared<TFTPTransferSocket>(io_service, local_endpoint().address());
    std::unique_ptr<TFTPTransfer> transfer(new TFTPSendTransfer(io_service, *transfer_socket, TFTPRole::SERVER_UPLOAD,
                                                                peer, decision.handler, config, decision.data));
    spawn_transfer(transfer_socket, std::move(transfer));
  }catch(const boost::system::system_error& e){
    BOOST_LOG_TRIVIAL(error) << "Could not open a transfer socket for " << peer << ": " << e.what();
    send_error(peer, TFTP_ERROR_NOT_DEFINED, "Could not open transfer socket");
  }
}

//Private
void TFTPServer::write_decided(boost::asio::ip::udp::endpoint peer, std::string filename, const TFTPWriteDecision& decision)
{
  if(!running) return;

  if(!decision.accepted){
    BOOST_LOG_TRIVIAL(info) << "Refused write of " << filename << " by " << peer << " (error " << decision.error_code << ")";
    send_error(peer, decision.error_code,
               decision.reason.empty() ? tftp_error_message(decision.error_code) : decision.reason);
    return;
  }

  try{
    std::shared_ptr<TFTPTransferSocket> transfer_socket =
        std::make_shared<TFTPTransferSocket>(io_service, local_endpoint().address());
    std::unique_ptr<TFTPTransfer> transfer(new TFTPReceiveTransfer(io_service, *transfer_socket, TFTPRole::SERVER_DOWNLOAD,
                                                                   peer, decision.handler, config));
    spawn_transfer(transfer_socket, std::move(transfer));
  }catch(const boost::system::system_error& e){
    BOOST_LOG_TRIVIAL(error) << "Could not open a transfer socket for " << peer << ": " << e.what();
    send_error(peer, TFTP_ERROR_NOT_DEFINED, "Could not open transfer socket");
  }
}

//Private
void TFTPServer::spawn_transfer(std::shared_ptr<TFTPTransferSocket> transfer_socket, std::unique_ptr<TFTPTransfer> transfer)
{
  transfer_socket->attach(std::move(transfer));
  transfer_socket->set_closed_handler(boost::bind(&TFTPServer::forget_transfer, this, transfer_socket.get()));
  transfers.push_back(transfer_socket);
  transfer_socket->start();
}

//Private
void TFTPServer::forget_transfer(const TFTPTransferSocket* transfer_socket)
{
  std::list<std::weak_ptr<TFTPTransferSocket> >::iterator it = transfers.begin();
  while(it != transfers.end()){
    std::shared_ptr<TFTPTransferSocket> tracked = it->lock();
    if(!tracked || tracked.get() == transfer_socket){
      it = transfers.erase(it);
    }else{
      ++it;
    }
  }
}

//Private
void TFTPServer::send_error(const boost::asio::ip::udp::endpoint& peer, std::uint16_t code, const std::string& message)
{
  boost::system::error_code error;
  sock.send_to(boost::asio::buffer(encode_error(code, message)), peer, 0, error);
  if(error){
    BOOST_LOG_TRIVIAL(warning) << "Sending ERROR " << code << " to " << peer << " failed: " << error.message();
  }
}
