#ifndef _TFTP_RETRANSMISSION_TIMER_HPP
#define _TFTP_RETRANSMISSION_TIMER_HPP

#include <functional>
#include <memory>
#include <boost/asio.hpp>
#include <boost/asio/deadline_timer.hpp>

#include "TFTPConfig.hpp"
#include "TFTPPacket.hpp"

/**
 * @brief Single outstanding retransmission of the last packet of a transfer
 * Every time the timer fires the delay is doubled. While the doubled delay stays
 * within the configured maximum the packet is resent, after that the expired
 * handler is called once and the timer stays disarmed.
 */
class TFTPRetransmissionTimer{
public:
  typedef std::function<void(const TFTPBuffer&)> ResendHandler;
  typedef std::function<void()> ExpiredHandler;

  TFTPRetransmissionTimer(boost::asio::io_service& aIoService, const TFTPTransferConfig& aConfig);
  TFTPRetransmissionTimer(const TFTPRetransmissionTimer& obj) = delete;
  ~TFTPRetransmissionTimer();

  void set_handlers(ResendHandler aResend, ExpiredHandler aExpired);

  /**
   * @brief Start waiting for a reply to payload
   * Replaces whatever was armed before and restarts from the base timeout.
   */
  void arm(const TFTPBuffer& payload);

  /**
   * @brief Stop waiting and reset the delay to the base timeout
   */
  void disarm();

  bool is_armed() const { return armed; }
  boost::posix_time::time_duration current_timeout() const { return timeout; }

private:
  //Outlives the timer so a handler queued before destruction can tell it is stale
  struct Guard{
    TFTPRetransmissionTimer* timer;
  };

  static void handle_timeout(std::shared_ptr<Guard> timer_guard, unsigned long fired_generation,
                             const boost::system::error_code& error);
  void fire(unsigned long fired_generation);
  void schedule();

  boost::asio::deadline_timer retransmission_timer;
  boost::posix_time::time_duration base_timeout;
  boost::posix_time::time_duration max_timeout;
  boost::posix_time::time_duration timeout;

  TFTPBuffer payload;
  bool armed;
  unsigned long generation;
  std::shared_ptr<Guard> guard;

  ResendHandler resend_handler;
  ExpiredHandler expired_handler;
};

#endif
