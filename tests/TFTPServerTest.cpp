#include "TFTPServer.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace {

class RecordingHandler : public TFTPTransferHandler{
public:
  RecordingHandler() : completed(0), failed(0) {}

  TFTPBlockDecision on_block(const TFTPBuffer& block) override
  {
    data.insert(data.end(), block.begin(), block.end());
    return TFTPBlockDecision::accept();
  }
  void on_complete() override { ++completed; }
  void on_failed(const std::string& message) override
  {
    ++failed;
    failure = message;
  }

  TFTPBuffer data;
  int completed;
  int failed;
  std::string failure;
};

//Answers every request right away with whatever the test configured
class ScriptedServerHandler : public TFTPServerHandler{
public:
  ScriptedServerHandler() : reads(0), puts(0) {}

  void accept_read(const boost::asio::ip::udp::endpoint& peer, const std::string& filename, ReadReply reply) override
  {
    ++reads;
    last_filename = filename;
    reply(read_decision);
  }

  void accept_put(const boost::asio::ip::udp::endpoint& peer, const std::string& filename, WriteReply reply) override
  {
    ++puts;
    last_filename = filename;
    reply(write_decision);
  }

  void on_malformed_request(const boost::asio::ip::udp::endpoint& peer, const std::string& message) override
  {
    malformed.push_back(message);
    malformed_peer = peer;
  }

  TFTPReadDecision read_decision;
  TFTPWriteDecision write_decision;
  int reads;
  int puts;
  std::string last_filename;
  std::vector<std::string> malformed;
  boost::asio::ip::udp::endpoint malformed_peer;
};

class TFTPServerTest : public ::testing::Test {
protected:
  TFTPServerTest() : loopback(boost::asio::ip::address::from_string("127.0.0.1")), client(io_service) {}

  void SetUp() override
  {
    config.base_timeout = boost::posix_time::millisec(200);
    config.max_timeout = boost::posix_time::millisec(1600);

    server.reset(new TFTPServer(io_service, boost::asio::ip::udp::endpoint(loopback, 0), scripted, config));
    server->start();
    listen_endpoint = server->local_endpoint();

    client.open(boost::asio::ip::udp::v4());
    client.bind(boost::asio::ip::udp::endpoint(loopback, 0));
    transfer_handler = std::make_shared<RecordingHandler>();
  }

  void TearDown() override
  {
    server.reset();
  }

  TFTPPacket receive(boost::asio::ip::udp::endpoint& sender)
  {
    unsigned char buffer[TFTP_MAX_PACKET_SIZE];
    std::size_t size = client.receive_from(boost::asio::buffer(buffer), sender);
    return decode_packet(buffer, size);
  }

  //Decodes a packet that is expected to be an ERROR
  TFTPProtocolError receive_error(boost::asio::ip::udp::endpoint& sender)
  {
    try{
      receive(sender);
    }catch(const TFTPProtocolError& e){
      return e;
    }
    ADD_FAILURE() << "expected an ERROR packet";
    return TFTPProtocolError("none");
  }

  void send(const boost::asio::ip::udp::endpoint& to, const TFTPBuffer& packet)
  {
    client.send_to(boost::asio::buffer(packet), to);
  }

  //Cancelled timer waits complete as handlers too, so run until something visible happened
  template<typename Predicate>
  void run_until(Predicate done)
  {
    while(!done() && io_service.run_one()){
    }
  }

  bool client_has_data() { return client.available() > 0; }

  boost::asio::io_service io_service;
  boost::asio::ip::address loopback;
  boost::asio::ip::udp::socket client;
  ScriptedServerHandler scripted;
  TFTPTransferConfig config;
  std::unique_ptr<TFTPServer> server;
  boost::asio::ip::udp::endpoint listen_endpoint;
  std::shared_ptr<RecordingHandler> transfer_handler;
};

} // namespace

// ======================================================================
// Refusals
// ======================================================================

TEST_F(TFTPServerTest, RejectedReadGetsOneError) {
  scripted.read_decision = TFTPReadDecision::reject(TFTP_ERROR_FILE_NOT_FOUND);

  send(listen_endpoint, encode_request(TFTPOpcode::RRQ, "missing.txt"));
  io_service.run_one();

  EXPECT_EQ(1, scripted.reads);
  EXPECT_EQ("missing.txt", scripted.last_filename);

  boost::asio::ip::udp::endpoint sender;
  TFTPProtocolError error = receive_error(sender);
  EXPECT_EQ(TFTP_ERROR_FILE_NOT_FOUND, error.code());
  EXPECT_STREQ("File not found", error.what());
  EXPECT_EQ(listen_endpoint.port(), sender.port());

  EXPECT_EQ(0u, client.available());
  EXPECT_EQ(0u, server->active_transfers());
}

TEST_F(TFTPServerTest, RejectedWriteCarriesReason) {
  scripted.write_decision = TFTPWriteDecision::reject(TFTP_ERROR_ACCESS_VIOLATION, "Read only server");

  send(listen_endpoint, encode_request(TFTPOpcode::WRQ, "upload.bin"));
  io_service.run_one();

  boost::asio::ip::udp::endpoint sender;
  TFTPProtocolError error = receive_error(sender);
  EXPECT_EQ(TFTP_ERROR_ACCESS_VIOLATION, error.code());
  EXPECT_STREQ("Read only server", error.what());
  EXPECT_EQ(1, scripted.puts);
  EXPECT_EQ(0u, server->active_transfers());
}

TEST_F(TFTPServerTest, OversizedReadIsRefused) {
  scripted.read_decision = TFTPReadDecision::accept(TFTPBuffer(TFTP_MAX_TRANSFER_SIZE + 1));

  send(listen_endpoint, encode_request(TFTPOpcode::RRQ, "huge.iso"));
  io_service.run_one();

  boost::asio::ip::udp::endpoint sender;
  TFTPProtocolError error = receive_error(sender);
  EXPECT_EQ(TFTP_ERROR_DISK_FULL, error.code());
  EXPECT_EQ(0u, server->active_transfers());
}

// ======================================================================
// Stray packets
// ======================================================================

TEST_F(TFTPServerTest, DataOnListeningPortIsUnknownTransfer) {
  send(listen_endpoint, encode_ack(3));
  send(listen_endpoint, encode_data(1, TFTPBuffer(4, 'z')));
  io_service.run_one();
  io_service.run_one();

  //Only the DATA is answered
  boost::asio::ip::udp::endpoint sender;
  TFTPProtocolError error = receive_error(sender);
  EXPECT_EQ(TFTP_ERROR_UNKNOWN_TRANSFER_ID, error.code());
  EXPECT_STREQ("Unknown transfer ID", error.what());
  EXPECT_EQ(0u, client.available());
  EXPECT_EQ(0, scripted.reads + scripted.puts);
}

TEST_F(TFTPServerTest, MalformedRequestReachesHook) {
  send(listen_endpoint, TFTPBuffer(3, 0));
  send(listen_endpoint, encode_error(TFTP_ERROR_NOT_DEFINED, "stray"));
  io_service.run_one();
  io_service.run_one();

  ASSERT_EQ(2u, scripted.malformed.size());
  EXPECT_EQ("stray", scripted.malformed[1]);
  EXPECT_EQ(client.local_endpoint(), scripted.malformed_peer);
  EXPECT_EQ(0u, client.available());
}

// ======================================================================
// Accepted requests
// ======================================================================

TEST_F(TFTPServerTest, AcceptedReadRunsOnItsOwnPort) {
  TFTPBuffer file(700, 'r');
  scripted.read_decision = TFTPReadDecision::accept(file, transfer_handler);

  send(listen_endpoint, encode_request(TFTPOpcode::RRQ, "file.bin"));
  io_service.run_one();
  EXPECT_EQ(1u, server->active_transfers());

  boost::asio::ip::udp::endpoint transfer_endpoint;
  TFTPPacket first = receive(transfer_endpoint);
  EXPECT_NE(listen_endpoint.port(), transfer_endpoint.port());
  EXPECT_EQ(1, first.block);
  EXPECT_EQ(512u, first.data.size());

  send(transfer_endpoint, encode_ack(1));
  run_until([this]() { return client_has_data(); });
  boost::asio::ip::udp::endpoint sender;
  TFTPPacket second = receive(sender);
  EXPECT_EQ(2, second.block);
  EXPECT_EQ(188u, second.data.size());

  send(transfer_endpoint, encode_ack(2));
  run_until([this]() { return transfer_handler->completed > 0; });
  EXPECT_EQ(1, transfer_handler->completed);
  EXPECT_EQ(0u, server->active_transfers());
}

TEST_F(TFTPServerTest, AcceptedWriteOpensWithAckZero) {
  scripted.write_decision = TFTPWriteDecision::accept(transfer_handler);

  send(listen_endpoint, encode_request(TFTPOpcode::WRQ, "upload.bin"));
  io_service.run_one();

  boost::asio::ip::udp::endpoint transfer_endpoint;
  TFTPPacket ack = receive(transfer_endpoint);
  EXPECT_EQ(TFTPOpcode::ACK, ack.opcode);
  EXPECT_EQ(0, ack.block);

  send(transfer_endpoint, encode_data(1, TFTPBuffer(3, 'w')));
  run_until([this]() { return transfer_handler->completed > 0; });

  boost::asio::ip::udp::endpoint sender;
  TFTPPacket final_ack = receive(sender);
  EXPECT_EQ(1, final_ack.block);
  EXPECT_EQ(TFTPBuffer(3, 'w'), transfer_handler->data);
  EXPECT_EQ(1, transfer_handler->completed);
}

TEST_F(TFTPServerTest, FinishedTransfersAreForgotten) {
  scripted.read_decision = TFTPReadDecision::accept(TFTPBuffer(10, 'f'), transfer_handler);

  for(int i = 1; i <= 50; ++i){
    send(listen_endpoint, encode_request(TFTPOpcode::RRQ, "small.txt"));
    run_until([this]() { return client_has_data(); });
    ASSERT_EQ(1u, server->active_transfers());

    boost::asio::ip::udp::endpoint transfer_endpoint;
    TFTPPacket data = receive(transfer_endpoint);
    ASSERT_EQ(1, data.block);

    send(transfer_endpoint, encode_ack(1));
    run_until([this, i]() { return transfer_handler->completed == i; });
    ASSERT_EQ(i, transfer_handler->completed);
    EXPECT_EQ(0u, server->active_transfers());
  }
  EXPECT_EQ(50, scripted.reads);
}

TEST_F(TFTPServerTest, StopClosesRunningTransfers) {
  scripted.read_decision = TFTPReadDecision::accept(TFTPBuffer(2000, 'r'), transfer_handler);

  send(listen_endpoint, encode_request(TFTPOpcode::RRQ, "file.bin"));
  io_service.run_one();
  ASSERT_EQ(1u, server->active_transfers());

  server->stop();
  EXPECT_EQ(1, transfer_handler->failed);
  EXPECT_EQ("Connection closed", transfer_handler->failure);
  EXPECT_EQ(0u, server->active_transfers());

  //Nothing is left to wait for
  io_service.run();
}
