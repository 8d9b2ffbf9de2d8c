#include "TFTPClient.hpp"
#include "TFTPLog.hpp"
#include "TFTPOptions.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <boost/bind/bind.hpp>


namespace {

int exit_code = 1;

void download_finished(const std::string& local_file, const TFTPResult& result)
{
  if(!result.success){
    BOOST_LOG_TRIVIAL(error) << "Download failed: " << result.error;
    return;
  }

  std::ofstream output_file(local_file, std::ios::binary | std::ios::trunc);
  output_file.write(reinterpret_cast<const char*>(result.data.data()), result.data.size());
  output_file.close();
  if(output_file.fail()){
    BOOST_LOG_TRIVIAL(error) << "Cant write local output file: " << local_file;
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Received " << result.data.size() << " bytes into " << local_file;
  exit_code = 0;
}

void upload_finished(const TFTPResult& result)
{
  if(!result.success){
    BOOST_LOG_TRIVIAL(error) << "Upload failed: " << result.error;
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Upload complete";
  exit_code = 0;
}

} // namespace


int main(int argc, char **argv) {
  TFTPClientOptions options;
  try{
    options = parse_client_options(argc, argv);
  }catch(const std::exception& e){
    std::cerr << e.what() << std::endl;
    return 2;
  }
  if(options.help){
    std::cout << options.usage << std::endl;
    return 0;
  }

  try{
    init_logging(options.log_level);

    boost::asio::io_service io_service;
    TFTPClient local(io_service, options.host, options.port, options.transfer);

    if(options.command == "get"){
      local.read_file_async(options.remote_file,
                            boost::bind(&download_finished, options.local_file, boost::placeholders::_1));
    }else{
      std::ifstream input_file(options.local_file, std::ios::binary);
      if(!input_file.is_open()){
        BOOST_LOG_TRIVIAL(error) << "Cant open local file: " << options.local_file << ", Does it exists?";
        return 1;
      }
      TFTPBuffer content((std::istreambuf_iterator<char>(input_file)), std::istreambuf_iterator<char>());
      local.write_file_async(options.remote_file, content, &upload_finished);
    }

    io_service.run();
  }catch(const std::exception& e){
    BOOST_LOG_TRIVIAL(fatal) << e.what();
    return 1;
  }

  return exit_code;
}
