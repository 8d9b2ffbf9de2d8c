#include "TFTPPacket.hpp"

#include <gtest/gtest.h>
#include <string>

namespace {

TFTPBuffer bytes(const std::string& text)
{
  return TFTPBuffer(text.begin(), text.end());
}

} // namespace

// ======================================================================
// Encode / decode
// ======================================================================

TEST(TFTPPacketTest, ReadRequestRoundTrip) {
  TFTPBuffer wire = encode_request(TFTPOpcode::RRQ, "boot/kernel.img");

  ASSERT_EQ(bytes(std::string("\x00\x01" "boot/kernel.img\0octet\0", 24)), wire);

  TFTPPacket packet = decode_packet(wire);
  EXPECT_EQ(TFTPOpcode::RRQ, packet.opcode);
  EXPECT_EQ("boot/kernel.img", packet.filename);
  EXPECT_EQ("octet", packet.mode);
}

TEST(TFTPPacketTest, WriteRequestKeepsMode) {
  TFTPPacket packet = decode_packet(encode_request(TFTPOpcode::WRQ, "notes.txt", "NetASCII"));

  EXPECT_EQ(TFTPOpcode::WRQ, packet.opcode);
  EXPECT_EQ("notes.txt", packet.filename);
  EXPECT_EQ("NetASCII", packet.mode);
}

TEST(TFTPPacketTest, DataRoundTrip) {
  TFTPBuffer payload(512, 0xab);
  TFTPBuffer wire = encode_data(0x1234, payload);

  ASSERT_EQ(516u, wire.size());
  EXPECT_EQ(0x00, wire[0]);
  EXPECT_EQ(0x03, wire[1]);
  EXPECT_EQ(0x12, wire[2]);
  EXPECT_EQ(0x34, wire[3]);

  TFTPPacket packet = decode_packet(wire);
  EXPECT_EQ(TFTPOpcode::DATA, packet.opcode);
  EXPECT_EQ(0x1234, packet.block);
  EXPECT_EQ(payload, packet.data);
}

TEST(TFTPPacketTest, EmptyDataBlock) {
  TFTPPacket packet = decode_packet(encode_data(3, TFTPBuffer()));

  EXPECT_EQ(TFTPOpcode::DATA, packet.opcode);
  EXPECT_EQ(3, packet.block);
  EXPECT_TRUE(packet.data.empty());
}

TEST(TFTPPacketTest, AckRoundTrip) {
  TFTPBuffer wire = encode_ack(0xffff);
  ASSERT_EQ(bytes(std::string("\x00\x04\xff\xff", 4)), wire);

  TFTPPacket packet = decode_packet(wire);
  EXPECT_EQ(TFTPOpcode::ACK, packet.opcode);
  EXPECT_EQ(0xffff, packet.block);
}

TEST(TFTPPacketTest, ErrorEncoding) {
  EXPECT_EQ(bytes(std::string("\x00\x05\x00\x01" "File not found\0", 19)),
            encode_error(TFTP_ERROR_FILE_NOT_FOUND, "File not found"));
}

// ======================================================================
// Decode failures
// ======================================================================

TEST(TFTPPacketTest, RejectsShortAndLongDatagrams) {
  EXPECT_THROW(decode_packet(bytes(std::string("\x00\x04\x00", 3))), TFTPProtocolError);

  TFTPBuffer oversized = encode_data(1, TFTPBuffer(512, 0));
  oversized.push_back(0);
  EXPECT_THROW(decode_packet(oversized), TFTPProtocolError);
}

TEST(TFTPPacketTest, RejectsUnknownOpcode) {
  try{
    decode_packet(bytes(std::string("\x00\x09\x00\x01", 4)));
    FAIL() << "opcode 9 decoded";
  }catch(const TFTPProtocolError& e){
    EXPECT_FALSE(e.from_peer());
    EXPECT_EQ(TFTP_ERROR_ILLEGAL_OPERATION, e.code());
  }
}

TEST(TFTPPacketTest, ErrorPacketCarriesPeerMessage) {
  try{
    decode_packet(encode_error(TFTP_ERROR_ACCESS_VIOLATION, "go away"));
    FAIL() << "ERROR packet decoded";
  }catch(const TFTPProtocolError& e){
    EXPECT_TRUE(e.from_peer());
    EXPECT_EQ(TFTP_ERROR_ACCESS_VIOLATION, e.code());
    EXPECT_STREQ("go away", e.what());
  }
}

TEST(TFTPPacketTest, EmptyErrorMessageUsesCannedText) {
  try{
    decode_packet(encode_error(TFTP_ERROR_FILE_EXISTS, ""));
    FAIL() << "ERROR packet decoded";
  }catch(const TFTPProtocolError& e){
    EXPECT_STREQ("File already exists", e.what());
  }

  try{
    decode_packet(encode_error(42, ""));
    FAIL() << "ERROR packet decoded";
  }catch(const TFTPProtocolError& e){
    EXPECT_EQ(42, e.code());
    EXPECT_STREQ("Unknown error", e.what());
  }
}

TEST(TFTPPacketTest, RequestValidation) {
  //No terminator after the mode
  EXPECT_THROW(decode_packet(bytes(std::string("\x00\x01" "file\0octet", 12))), TFTPProtocolError);
  //Empty filename
  EXPECT_THROW(decode_packet(bytes(std::string("\x00\x01\0octet\0", 9))), TFTPProtocolError);
  //Unknown mode
  EXPECT_THROW(decode_packet(encode_request(TFTPOpcode::RRQ, "file", "binary")), TFTPProtocolError);

  EXPECT_NO_THROW(decode_packet(encode_request(TFTPOpcode::RRQ, "file", "MAIL")));
}

TEST(TFTPPacketTest, HighBitModeIsUnknown) {
  //"\xC3ctet" and "OCT\xC9T" only look like octet
  TFTPBuffer wire = bytes(std::string("\x00\x01" "file\0" "\xC3" "ctet\0", 13));
  try{
    decode_packet(wire);
    ADD_FAILURE() << "expected a TFTPProtocolError";
  }catch(const TFTPProtocolError& e){
    EXPECT_EQ(TFTP_ERROR_ILLEGAL_OPERATION, e.code());
  }
  EXPECT_THROW(decode_packet(encode_request(TFTPOpcode::WRQ, "file", "OCT\xC9T")), TFTPProtocolError);
}

TEST(TFTPPacketTest, RequestIgnoresTrailingBytes) {
  TFTPBuffer wire = encode_request(TFTPOpcode::RRQ, "file");
  TFTPBuffer extra = bytes(std::string("blksize\0" "1024\0", 13));
  wire.insert(wire.end(), extra.begin(), extra.end());

  TFTPPacket packet = decode_packet(wire);
  EXPECT_EQ("file", packet.filename);
  EXPECT_EQ("octet", packet.mode);
}

TEST(TFTPPacketTest, AckMustBeFourBytes) {
  TFTPBuffer wire = encode_ack(1);
  wire.push_back(0);
  EXPECT_THROW(decode_packet(wire), TFTPProtocolError);
}

// ======================================================================
// Caller errors
// ======================================================================

TEST(TFTPPacketTest, OversizedPayloadIsRejected) {
  EXPECT_THROW(encode_data(1, TFTPBuffer(513, 0)), std::length_error);
}

TEST(TFTPPacketTest, RequestNeedsRequestOpcode) {
  EXPECT_THROW(encode_request(TFTPOpcode::ACK, "file"), std::invalid_argument);
}

TEST(TFTPPacketTest, CannedMessages) {
  EXPECT_EQ("Unknown error", tftp_error_message(TFTP_ERROR_NOT_DEFINED));
  EXPECT_EQ("Illegal TFTP operation", tftp_error_message(TFTP_ERROR_ILLEGAL_OPERATION));
  EXPECT_EQ("Unknown transfer ID", tftp_error_message(TFTP_ERROR_UNKNOWN_TRANSFER_ID));
  EXPECT_EQ("No such user", tftp_error_message(TFTP_ERROR_NO_SUCH_USER));
}
