#ifndef _TFTP_SEND_TRANSFER_HPP
#define _TFTP_SEND_TRANSFER_HPP

#include <string>
#include <cstddef>
#include "TFTPTransfer.hpp"

/**
 * @brief Sending side of a transfer (client upload, server side of a RRQ)
 * The whole file is held in memory and sent block by block, each block is only
 * sent after the previous one has been acknowledged.
 */
class TFTPSendTransfer : public TFTPTransfer{
public:
  //remote_file is only used by a client upload, it is sent in the WRQ
  TFTPSendTransfer(boost::asio::io_service& aIoService, TFTPPacketSink& aSink, TFTPRole aRole,
                   const boost::asio::ip::udp::endpoint& aPeer,
                   std::shared_ptr<TFTPTransferHandler> aHandler, const TFTPTransferConfig& aConfig,
                   const TFTPBuffer& aData, const std::string& aRemoteFile = std::string());

  void start() override;
  TFTPDirection direction() const override { return TFTPDirection::SEND; }

  std::size_t bytes_sent() const { return cursor; }
  bool final_block_sent() const { return last_block_sent; }

protected:
  void handle_ack(const TFTPPacket& packet) override;

private:
  void send_block();

  TFTPBuffer buffer;
  std::size_t cursor;
  bool last_block_sent;
  std::string remote_file;
};

#endif
