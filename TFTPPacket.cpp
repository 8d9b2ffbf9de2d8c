#include "TFTPPacket.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <iterator>


namespace {

void append_u16(TFTPBuffer& buffer, std::uint16_t value)
{
  buffer.push_back(static_cast<unsigned char>((value >> 8) & 0xff));
  buffer.push_back(static_cast<unsigned char>(value & 0xff));
}

std::uint16_t read_u16(const unsigned char* data)
{
  return static_cast<std::uint16_t>((data[0] << 8) | data[1]);
}

//Reads a NUL terminated string starting at pos, pos ends up past the terminator
bool read_string(const unsigned char* data, std::size_t size, std::size_t& pos, std::string& out)
{
  const unsigned char* begin = data + pos;
  const unsigned char* end = static_cast<const unsigned char*>(std::memchr(begin, '\0', size - pos));
  if(end == nullptr) return false;

  out.assign(reinterpret_cast<const char*>(begin), end - begin);
  pos += (end - begin) + 1;
  return true;
}

bool is_known_mode(std::string mode)
{
  std::transform(mode.begin(), mode.end(), mode.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return mode == "netascii" || mode == "octet" || mode == "mail";
}

} // namespace


TFTPProtocolError::TFTPProtocolError(const std::string& aMessage, std::uint16_t aCode, bool aFromPeer) :
      std::runtime_error(aMessage), error_code(aCode), peer_error(aFromPeer)
{
}


TFTPPacket decode_packet(const unsigned char* data, std::size_t size)
{
  if(size < TFTP_MIN_PACKET_SIZE){
    throw TFTPProtocolError("TFTP packet too small (" + std::to_string(size) + " bytes)");
  }
  if(size > TFTP_MAX_PACKET_SIZE){
    throw TFTPProtocolError("TFTP packet too large (" + std::to_string(size) + " bytes)");
  }

  std::uint16_t opcode = read_u16(data);
  TFTPPacket packet;

  switch(opcode){
  case static_cast<std::uint16_t>(TFTPOpcode::RRQ):
  case static_cast<std::uint16_t>(TFTPOpcode::WRQ): {
    packet.opcode = static_cast<TFTPOpcode>(opcode);
    std::size_t pos = 2;
    if(!read_string(data, size, pos, packet.filename) || pos >= size ||
       !read_string(data, size, pos, packet.mode)){
      throw TFTPProtocolError("Malformed TFTP request (missing NUL terminator)", TFTP_ERROR_ILLEGAL_OPERATION);
    }
    if(packet.filename.empty()){
      throw TFTPProtocolError("Malformed TFTP request (empty filename)", TFTP_ERROR_ILLEGAL_OPERATION);
    }
    if(!is_known_mode(packet.mode)){
      throw TFTPProtocolError("Unsupported TFTP transfer mode: " + packet.mode, TFTP_ERROR_ILLEGAL_OPERATION);
    }
    break;
  }

  case static_cast<std::uint16_t>(TFTPOpcode::DATA):
    packet.opcode = TFTPOpcode::DATA;
    packet.block = read_u16(data + 2);
    packet.data.assign(data + TFTP_DATA_HEADER_SIZE, data + size);
    break;

  case static_cast<std::uint16_t>(TFTPOpcode::ACK):
    if(size != TFTP_DATA_HEADER_SIZE){
      throw TFTPProtocolError("Malformed TFTP ACK (" + std::to_string(size) + " bytes)", TFTP_ERROR_ILLEGAL_OPERATION);
    }
    packet.opcode = TFTPOpcode::ACK;
    packet.block = read_u16(data + 2);
    break;

  case static_cast<std::uint16_t>(TFTPOpcode::ERR): {
    //An ERROR packet is never handed out as a packet, it ends the transfer
    std::uint16_t code = read_u16(data + 2);
    const char* text = reinterpret_cast<const char*>(data + 4);
    std::string message(text, ::strnlen(text, size - 4));
    if(message.empty()){
      message = tftp_error_message(code);
    }
    throw TFTPProtocolError(message, code, true);
  }

  default:
    throw TFTPProtocolError("Unknown TFTP packet type (code " + std::to_string(opcode) + ")",
                            TFTP_ERROR_ILLEGAL_OPERATION);
  }

  return packet;
}

TFTPPacket decode_packet(const TFTPBuffer& datagram)
{
  return decode_packet(datagram.data(), datagram.size());
}


TFTPBuffer encode_request(TFTPOpcode opcode, const std::string& filename, const std::string& mode)
{
  if(opcode != TFTPOpcode::RRQ && opcode != TFTPOpcode::WRQ){
    throw std::invalid_argument(std::string("Not a TFTP request opcode: ") + tftp_opcode_name(opcode));
  }

  TFTPBuffer packet;
  packet.reserve(4 + filename.size() + mode.size());
  append_u16(packet, static_cast<std::uint16_t>(opcode));

  //Copy the filename and the mode into the buffer
  std::copy(filename.begin(), filename.end(), std::back_inserter(packet));
  packet.push_back('\0');
  std::copy(mode.begin(), mode.end(), std::back_inserter(packet));
  packet.push_back('\0');
  return packet;
}

TFTPBuffer encode_data(std::uint16_t block, const unsigned char* payload, std::size_t size)
{
  if(size > TFTP_BLOCK_SIZE){
    throw std::length_error("TFTP data block exceeds " + std::to_string(TFTP_BLOCK_SIZE) + " bytes");
  }

  TFTPBuffer packet;
  packet.reserve(TFTP_DATA_HEADER_SIZE + size);
  append_u16(packet, static_cast<std::uint16_t>(TFTPOpcode::DATA));
  append_u16(packet, block);
  packet.insert(packet.end(), payload, payload + size);
  return packet;
}

TFTPBuffer encode_data(std::uint16_t block, const TFTPBuffer& payload)
{
  return encode_data(block, payload.data(), payload.size());
}

TFTPBuffer encode_ack(std::uint16_t block)
{
  TFTPBuffer packet;
  packet.reserve(TFTP_DATA_HEADER_SIZE);
  append_u16(packet, static_cast<std::uint16_t>(TFTPOpcode::ACK));
  append_u16(packet, block);
  return packet;
}

TFTPBuffer encode_error(std::uint16_t code, const std::string& message)
{
  TFTPBuffer packet;
  packet.reserve(5 + message.size());
  append_u16(packet, static_cast<std::uint16_t>(TFTPOpcode::ERR));
  append_u16(packet, code);
  std::copy(message.begin(), message.end(), std::back_inserter(packet));
  packet.push_back('\0');
  return packet;
}


std::string tftp_error_message(std::uint16_t code)
{
  switch(code){
  case TFTP_ERROR_FILE_NOT_FOUND:       return "File not found";
  case TFTP_ERROR_ACCESS_VIOLATION:     return "Access violation";
  case TFTP_ERROR_DISK_FULL:            return "Disk full or allocation exceeded";
  case TFTP_ERROR_ILLEGAL_OPERATION:    return "Illegal TFTP operation";
  case TFTP_ERROR_UNKNOWN_TRANSFER_ID:  return "Unknown transfer ID";
  case TFTP_ERROR_FILE_EXISTS:          return "File already exists";
  case TFTP_ERROR_NO_SUCH_USER:         return "No such user";
  default:                              return "Unknown error";
  }
}

const char* tftp_opcode_name(TFTPOpcode opcode)
{
  switch(opcode){
  case TFTPOpcode::RRQ:  return "RRQ";
  case TFTPOpcode::WRQ:  return "WRQ";
  case TFTPOpcode::DATA: return "DATA";
  case TFTPOpcode::ACK:  return "ACK";
  case TFTPOpcode::ERR:  return "ERROR";
  }
  return "UNKNOWN";
}
