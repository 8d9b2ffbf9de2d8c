#ifndef _TFTP_PACKET_HPP
#define _TFTP_PACKET_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <cstddef>

enum class TFTPOpcode : std::uint16_t {
  RRQ = 1,
  WRQ = 2,
  DATA = 3,
  ACK = 4,
  ERR = 5
};

const std::uint16_t TFTP_ERROR_NOT_DEFINED = 0;
const std::uint16_t TFTP_ERROR_FILE_NOT_FOUND = 1;
const std::uint16_t TFTP_ERROR_ACCESS_VIOLATION = 2;
const std::uint16_t TFTP_ERROR_DISK_FULL = 3;
const std::uint16_t TFTP_ERROR_ILLEGAL_OPERATION = 4;
const std::uint16_t TFTP_ERROR_UNKNOWN_TRANSFER_ID = 5;
const std::uint16_t TFTP_ERROR_FILE_EXISTS = 6;
const std::uint16_t TFTP_ERROR_NO_SUCH_USER = 7;

const std::size_t TFTP_BLOCK_SIZE = 512;
const std::size_t TFTP_DATA_HEADER_SIZE = 4;
const std::size_t TFTP_MIN_PACKET_SIZE = 4;
const std::size_t TFTP_MAX_PACKET_SIZE = TFTP_DATA_HEADER_SIZE + TFTP_BLOCK_SIZE;

//Block numbers are 16 bit and start at 1, so this is the largest buffer that
//still fits (the last block has to be shorter than TFTP_BLOCK_SIZE)
const std::size_t TFTP_MAX_TRANSFER_SIZE = 65535 * TFTP_BLOCK_SIZE - 1;

typedef std::vector<unsigned char> TFTPBuffer;

/**
 * @brief A decoded TFTP packet
 * Only the fields belonging to the opcode are meaningful.
 */
struct TFTPPacket{
  TFTPPacket() : opcode(TFTPOpcode::ACK), block(0), error_code(TFTP_ERROR_NOT_DEFINED) {}

  TFTPOpcode opcode;

  //RRQ and WRQ
  std::string filename;
  std::string mode;

  //DATA and ACK
  std::uint16_t block;
  TFTPBuffer data;

  //ERROR
  std::uint16_t error_code;
  std::string error_message;
};

/**
 * @brief Raised when a datagram cannot be turned into a usable packet
 * An ERROR packet from the peer is reported this way as well, with from_peer() set.
 */
class TFTPProtocolError : public std::runtime_error{
public:
  explicit TFTPProtocolError(const std::string& aMessage,
                             std::uint16_t aCode = TFTP_ERROR_NOT_DEFINED,
                             bool aFromPeer = false);

  std::uint16_t code() const { return error_code; }
  bool from_peer() const { return peer_error; }

private:
  std::uint16_t error_code;
  bool peer_error;
};

/**
 * @brief Decode a datagram
 * Throws TFTPProtocolError for anything that is not a valid RRQ, WRQ, DATA or ACK.
 */
TFTPPacket decode_packet(const unsigned char* data, std::size_t size);
TFTPPacket decode_packet(const TFTPBuffer& datagram);

TFTPBuffer encode_request(TFTPOpcode opcode, const std::string& filename, const std::string& mode = "octet");
TFTPBuffer encode_data(std::uint16_t block, const unsigned char* payload, std::size_t size);
TFTPBuffer encode_data(std::uint16_t block, const TFTPBuffer& payload);
TFTPBuffer encode_ack(std::uint16_t block);
TFTPBuffer encode_error(std::uint16_t code, const std::string& message);

//Canned RFC 1350 text for an error code
std::string tftp_error_message(std::uint16_t code);

const char* tftp_opcode_name(TFTPOpcode opcode);

#endif
