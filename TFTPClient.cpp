#include "TFTPClient.hpp"
#include "TFTPTransferSocket.hpp"
#include "TFTPReceiveTransfer.hpp"
#include "TFTPSendTransfer.hpp"

#include <memory>
#include <boost/bind/bind.hpp>
#include <boost/log/trivial.hpp>


namespace {

//Collects the downloaded blocks and reports the outcome to the caller
class TFTPClientTransferHandler : public TFTPTransferHandler{
public:
  explicit TFTPClientTransferHandler(TFTPClient::ResultHandler aCallback) : callback(aCallback) {}

  TFTPBlockDecision on_block(const TFTPBuffer& block) override
  {
    result.data.insert(result.data.end(), block.begin(), block.end());
    return TFTPBlockDecision::accept();
  }

  void on_complete() override
  {
    result.success = true;
    callback(result);
  }

  void on_failed(const std::string& message) override
  {
    result.success = false;
    result.data.clear();
    result.error = message;
    callback(result);
  }

private:
  TFTPClient::ResultHandler callback;
  TFTPResult result;
};

} // namespace


TFTPClient::TFTPClient(boost::asio::io_service& aIoService, std::string aHost, std::string aPort,
                       const TFTPTransferConfig& aConfig) :
      io_service(aIoService), host(aHost), config(aConfig)
{
  //Resolve server
  boost::asio::ip::udp::resolver resolver(io_service);
  boost::asio::ip::udp::resolver::query query(
                                              boost::asio::ip::udp::v4(),
                                              host,
                                              aPort);
  server_endpoint = *resolver.resolve(query);
}

void TFTPClient::read_file_async(const std::string& remote_file, ResultHandler callback)
{
  std::shared_ptr<TFTPTransferSocket> transfer_socket =
      std::make_shared<TFTPTransferSocket>(io_service, boost::asio::ip::address_v4::any());
  std::shared_ptr<TFTPTransferHandler> handler = std::make_shared<TFTPClientTransferHandler>(callback);

  std::unique_ptr<TFTPTransfer> transfer(new TFTPReceiveTransfer(io_service, *transfer_socket, TFTPRole::CLIENT_DOWNLOAD,
                                                                 server_endpoint, handler, config, remote_file));
  transfer_socket->attach(std::move(transfer));
  transfer_socket->start();
}

void TFTPClient::write_file_async(const std::string& remote_file, const TFTPBuffer& content, ResultHandler callback)
{
  if(content.size() > TFTP_MAX_TRANSFER_SIZE){
    BOOST_LOG_TRIVIAL(warning) << "Not sending " << remote_file << ", " << content.size() << " bytes is too large for TFTP";
    TFTPResult result;
    result.error = "File too large for TFTP";
    io_service.post(boost::bind<void>(callback, result));
    return;
  }

  std::shared_ptr<TFTPTransferSocket> transfer_socket =
      std::make_shared<TFTPTransferSocket>(io_service, boost::asio::ip::address_v4::any());
  std::shared_ptr<TFTPTransferHandler> handler = std::make_shared<TFTPClientTransferHandler>(callback);

  std::unique_ptr<TFTPTransfer> transfer(new TFTPSendTransfer(io_service, *transfer_socket, TFTPRole::CLIENT_UPLOAD,
                                                              server_endpoint, handler, config, content, remote_file));
  transfer_socket->attach(std::move(transfer));
  transfer_socket->start();
}
