#include "TFTPFileServer.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/bind/bind.hpp>
#include <boost/log/trivial.hpp>


namespace {

//Logs how a download of a served file ended
class TFTPDownloadLog : public TFTPTransferHandler{
public:
  explicit TFTPDownloadLog(const std::string& aPath) : path(aPath) {}

  void on_complete() override
  {
    BOOST_LOG_TRIVIAL(info) << "Sent " << path;
  }

  void on_failed(const std::string& message) override
  {
    BOOST_LOG_TRIVIAL(warning) << "Sending " << path << " failed: " << message;
  }

private:
  std::string path;
};

//Error code for a failed open or write of an upload
std::uint16_t upload_error_code(int error)
{
  switch(error){
  case EEXIST:
    return TFTP_ERROR_FILE_EXISTS;
  case ENOSPC:
  case EDQUOT:
    return TFTP_ERROR_DISK_FULL;
  default:
    return TFTP_ERROR_ACCESS_VIOLATION;
  }
}

/**
 * Writes an upload block by block into a file it created itself. The file is
 * removed again unless the transfer completes.
 */
class TFTPFileUpload : public TFTPTransferHandler{
public:
  TFTPFileUpload(const std::string& aPath, int aFd) : path(aPath), fd(aFd), received(0), finished(false) {}

  ~TFTPFileUpload()
  {
    //Accepted but never ran, or dropped halfway
    if(fd >= 0){
      ::close(fd);
      fd = -1;
    }
    if(!finished){
      ::unlink(path.c_str());
    }
  }

  TFTPBlockDecision on_block(const TFTPBuffer& block) override
  {
    std::size_t written = 0;
    while(written < block.size()){
      ssize_t result = ::write(fd, block.data() + written, block.size() - written);
      if(result < 0){
        if(errno == EINTR) continue;
        int error = errno;
        BOOST_LOG_TRIVIAL(error) << "Writing " << path << " failed: " << std::strerror(error);
        return TFTPBlockDecision::reject(upload_error_code(error));
      }
      written += static_cast<std::size_t>(result);
    }
    received += block.size();
    return TFTPBlockDecision::accept();
  }

  void on_complete() override
  {
    finished = true;
    int result = ::close(fd);
    fd = -1;
    if(result != 0){
      BOOST_LOG_TRIVIAL(error) << "Closing " << path << " failed: " << std::strerror(errno);
      ::unlink(path.c_str());
      return;
    }
    BOOST_LOG_TRIVIAL(info) << "Received " << path << " (" << received << " bytes)";
  }

  void on_failed(const std::string& message) override
  {
    BOOST_LOG_TRIVIAL(warning) << "Upload of " << path << " failed: " << message;
    finished = true;
    if(::close(fd) != 0){
      BOOST_LOG_TRIVIAL(warning) << "Closing " << path << " failed: " << std::strerror(errno);
    }
    fd = -1;
    ::unlink(path.c_str());
  }

private:
  std::string path;
  int fd;
  std::size_t received;
  //on_complete or on_failed ran, the file is no longer ours to clean up
  bool finished;
};

} // namespace


TFTPFileServer::TFTPFileServer(boost::asio::io_service& aIoService, std::string aRootDir,
                               std::size_t aWorkerThreads, bool aAllowWrite) :
      io_service(aIoService), root_dir(aRootDir), allow_write(aAllowWrite), workers(aWorkerThreads)
{
}

TFTPFileServer::~TFTPFileServer()
{
  workers.join();
}

void TFTPFileServer::accept_read(const boost::asio::ip::udp::endpoint& peer, const std::string& filename, ReadReply reply)
{
  std::string path = resolve_path(filename);
  if(path.empty()){
    BOOST_LOG_TRIVIAL(warning) << peer << " asked for " << filename << " outside of " << root_dir;
    reply(TFTPReadDecision::reject(TFTP_ERROR_ACCESS_VIOLATION));
    return;
  }

  WorkGuard work = std::make_shared<boost::asio::io_service::work>(io_service);
  boost::asio::post(workers, boost::bind(&TFTPFileServer::read_file, this, path, reply, work));
}

void TFTPFileServer::accept_put(const boost::asio::ip::udp::endpoint& peer, const std::string& filename, WriteReply reply)
{
  std::string path = resolve_path(filename);
  if(!allow_write || path.empty()){
    BOOST_LOG_TRIVIAL(warning) << "Refusing upload of " << filename << " from " << peer;
    reply(TFTPWriteDecision::reject(TFTP_ERROR_ACCESS_VIOLATION));
    return;
  }

  WorkGuard work = std::make_shared<boost::asio::io_service::work>(io_service);
  boost::asio::post(workers, boost::bind(&TFTPFileServer::open_upload, this, path, reply, work));
}

std::string TFTPFileServer::resolve_path(const std::string& filename) const
{
  std::string name = filename;
  if(!name.empty() && name[0] == '/'){
    name.erase(0, 1);
  }
  if(name.empty()) return std::string();

  std::istringstream parts(name);
  std::string part;
  while(std::getline(parts, part, '/')){
    if(part == "..") return std::string();
  }

  std::string root = root_dir;
  if(root.empty() || root[root.size() - 1] != '/'){
    root += '/';
  }
  return root + name;
}

//Private
//Runs on a worker thread
void TFTPFileServer::read_file(std::string path, ReadReply reply, WorkGuard work)
{
  TFTPReadDecision decision;

  struct stat info;
  if(::stat(path.c_str(), &info) != 0){
    decision = TFTPReadDecision::reject(errno == ENOENT ? TFTP_ERROR_FILE_NOT_FOUND : TFTP_ERROR_ACCESS_VIOLATION);
  }else if(!S_ISREG(info.st_mode)){
    decision = TFTPReadDecision::reject(TFTP_ERROR_ACCESS_VIOLATION);
  }else if(static_cast<unsigned long long>(info.st_size) > TFTP_MAX_TRANSFER_SIZE){
    decision = TFTPReadDecision::reject(TFTP_ERROR_DISK_FULL, "File too large for TFTP");
  }else{
    std::ifstream input_file(path, std::ios::binary);
    TFTPBuffer data((std::istreambuf_iterator<char>(input_file)), std::istreambuf_iterator<char>());
    if(!input_file.is_open() || input_file.bad()){
      decision = TFTPReadDecision::reject(TFTP_ERROR_ACCESS_VIOLATION);
    }else{
      decision = TFTPReadDecision::accept(data, std::make_shared<TFTPDownloadLog>(path));
    }
  }

  io_service.post(boost::bind<void>(reply, decision));
}

//Private
//Runs on a worker thread
void TFTPFileServer::open_upload(std::string path, WriteReply reply, WorkGuard work)
{
  TFTPWriteDecision decision;

  //O_EXCL reserves the name, a second upload of the same file is refused
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
  if(fd < 0){
    decision = TFTPWriteDecision::reject(upload_error_code(errno));
  }else{
    decision = TFTPWriteDecision::accept(std::make_shared<TFTPFileUpload>(path, fd));
  }

  io_service.post(boost::bind<void>(reply, decision));
}
