#ifndef _TFTP_RECEIVE_TRANSFER_HPP
#define _TFTP_RECEIVE_TRANSFER_HPP

#include <string>
#include "TFTPTransfer.hpp"

/**
 * @brief Receiving side of a transfer (client download, server side of a WRQ)
 * Every in-order DATA block is handed to the handler and acknowledged. A block
 * shorter than 512 bytes ends the transfer. A block the handler rejects is not
 * acknowledged, the transfer is aborted instead.
 */
class TFTPReceiveTransfer : public TFTPTransfer{
public:
  //remote_file is only used by a client download, it is sent in the RRQ
  TFTPReceiveTransfer(boost::asio::io_service& aIoService, TFTPPacketSink& aSink, TFTPRole aRole,
                      const boost::asio::ip::udp::endpoint& aPeer,
                      std::shared_ptr<TFTPTransferHandler> aHandler, const TFTPTransferConfig& aConfig,
                      const std::string& aRemoteFile = std::string());

  void start() override;
  TFTPDirection direction() const override { return TFTPDirection::RECEIVE; }

  //Block number of the next DATA packet we will accept
  std::uint16_t expected_block() const { return block; }

protected:
  void handle_data(const TFTPPacket& packet) override;

private:
  std::string remote_file;
};

#endif
