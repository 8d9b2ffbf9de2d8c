#ifndef _TFTP_CONFIG_HPP
#define _TFTP_CONFIG_HPP

#include <boost/date_time/posix_time/posix_time_types.hpp>

/**
 * @brief Per transfer tuning shared by every session
 */
struct TFTPTransferConfig{
  TFTPTransferConfig() :
      base_timeout(boost::posix_time::millisec(1500)),
      max_timeout(boost::posix_time::seconds(12)),
      await_final_ack(true)
  {}

  //First retransmission delay, doubled after every retransmission
  boost::posix_time::time_duration base_timeout;

  //Once the doubled delay exceeds this the transfer has timed out
  boost::posix_time::time_duration max_timeout;

  //Keep the final (short) DATA block armed until the peer acknowledges it.
  //When false the sender finishes right after transmitting it.
  bool await_final_ack;
};

#endif
