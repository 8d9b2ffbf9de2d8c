#include "TFTPTransferSocket.hpp"

#include <stdexcept>
#include <boost/bind/bind.hpp>
#include <boost/log/trivial.hpp>


TFTPTransferSocket::TFTPTransferSocket(boost::asio::io_service& aIoService, const boost::asio::ip::address& aLocalAddress) :
      sock(aIoService), closed(false)
{
  //Port 0, the OS hands out a fresh port which becomes our transfer ID
  boost::asio::ip::udp::endpoint local(aLocalAddress, 0);
  sock.open(local.protocol());
  sock.bind(local);
}

TFTPTransferSocket::~TFTPTransferSocket()
{
  close_socket();
}

void TFTPTransferSocket::attach(std::unique_ptr<TFTPTransfer> aTransfer)
{
  session = std::move(aTransfer);
  session->set_terminated_handler(boost::bind(&TFTPTransferSocket::close_socket, this));
}

void TFTPTransferSocket::start()
{
  if(!session){
    throw std::logic_error("TFTPTransferSocket started without a transfer");
  }

  BOOST_LOG_TRIVIAL(debug) << "Transfer socket " << local_endpoint() << " serving " << session->peer();
  session->start();
  if(!closed){
    receive_next();
  }
}

void TFTPTransferSocket::close()
{
  if(session && !session->is_terminal()){
    //The terminated handler closes the socket
    session->handle_failure("Connection closed");
    return;
  }
  close_socket();
}

void TFTPTransferSocket::send_packet(const boost::asio::ip::udp::endpoint& peer, const TFTPBuffer& packet)
{
  if(closed) return;

  boost::system::error_code error;
  sock.send_to(boost::asio::buffer(packet), peer, 0, error);
  if(error){
    //Lost like any other datagram, the retransmission timer covers it
    BOOST_LOG_TRIVIAL(warning) << "Sending " << packet.size() << " bytes to " << peer << " failed: " << error.message();
  }
}

boost::asio::ip::udp::endpoint TFTPTransferSocket::local_endpoint() const
{
  return sock.local_endpoint();
}

//Private
void TFTPTransferSocket::receive_next()
{
  sock.async_receive_from(
                            boost::asio::buffer(rx_buffer),
                            sender_endpoint,
                            boost::bind(
                              &TFTPTransferSocket::handle_receive,
                              shared_from_this(),
                              boost::asio::placeholders::error,
                              boost::asio::placeholders::bytes_transferred
                            )
                          );
}

//Private
//Gets called for every datagram that arrives on the transfer port
void TFTPTransferSocket::handle_receive(const boost::system::error_code& error, std::size_t bytes_transfered)
{
  //Async receive might have ended because the transfer closed the socket
  if(error == boost::asio::error::operation_aborted || closed) return;

  if(error){
    session->handle_failure("Connection closed: " + error.message());
    return;
  }

  //Transfer ID check, foreign datagrams never reach the transfer
  if(!session->accepts_datagram_from(sender_endpoint)){
    BOOST_LOG_TRIVIAL(debug) << "Dropping " << bytes_transfered << " bytes from unknown transfer ID " << sender_endpoint;
    receive_next();
    return;
  }

  TFTPPacket packet;
  bool decoded = false;
  try{
    packet = decode_packet(rx_buffer.data(), bytes_transfered);
    decoded = true;
  }catch(const TFTPProtocolError& e){
    session->handle_failure(e.what());
  }

  if(decoded){
    session->handle(packet);
  }

  if(!closed){
    receive_next();
  }
}

//Private
void TFTPTransferSocket::close_socket()
{
  if(closed) return;
  closed = true;

  boost::system::error_code error;
  sock.close(error);
  if(error){
    BOOST_LOG_TRIVIAL(warning) << "Closing transfer socket failed: " << error.message();
  }

  if(closed_handler){
    ClosedHandler done = closed_handler;
    closed_handler = nullptr;
    done();
  }
}
