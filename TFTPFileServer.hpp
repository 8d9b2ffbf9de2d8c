#ifndef _TFTP_FILE_SERVER_HPP
#define _TFTP_FILE_SERVER_HPP

#include <memory>
#include <string>
#include <cstddef>
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>

#include "TFTPServer.hpp"

/**
 * @brief Serves the files below a root directory
 * Files are read and uploads created on a worker pool, decisions are posted
 * back to the io_service. Uploads are refused unless allow_write is set, and
 * never replace an existing file: the file is created exclusively when the
 * WRQ is accepted and written block by block. A failed upload is removed.
 */
class TFTPFileServer : public TFTPServerHandler{
public:
  TFTPFileServer(boost::asio::io_service& aIoService, std::string aRootDir,
                 std::size_t aWorkerThreads = 2, bool aAllowWrite = false);
  TFTPFileServer(const TFTPFileServer& obj) = delete;
  ~TFTPFileServer();

  void accept_read(const boost::asio::ip::udp::endpoint& peer, const std::string& filename, ReadReply reply) override;
  void accept_put(const boost::asio::ip::udp::endpoint& peer, const std::string& filename, WriteReply reply) override;

  /**
   * @brief Path of a requested file below the root directory
   * A leading '/' is ignored. Returns an empty string for names that would
   * leave the root directory.
   */
  std::string resolve_path(const std::string& filename) const;

private:
  //Keeps io_service.run() from returning while a worker still has to post back
  typedef std::shared_ptr<boost::asio::io_service::work> WorkGuard;

  void read_file(std::string path, ReadReply reply, WorkGuard work);
  void open_upload(std::string path, WriteReply reply, WorkGuard work);

  boost::asio::io_service& io_service;
  std::string root_dir;
  bool allow_write;
  boost::asio::thread_pool workers;
};

#endif
