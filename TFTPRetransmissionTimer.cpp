#include "TFTPRetransmissionTimer.hpp"

#include <boost/bind/bind.hpp>
#include <boost/log/trivial.hpp>


TFTPRetransmissionTimer::TFTPRetransmissionTimer(boost::asio::io_service& aIoService, const TFTPTransferConfig& aConfig) :
      retransmission_timer(aIoService), base_timeout(aConfig.base_timeout), max_timeout(aConfig.max_timeout),
      timeout(aConfig.base_timeout), armed(false), generation(0), guard(std::make_shared<Guard>())
{
  guard->timer = this;
}

TFTPRetransmissionTimer::~TFTPRetransmissionTimer()
{
  guard->timer = nullptr;
  boost::system::error_code error;
  retransmission_timer.cancel(error);
  if(error){
    BOOST_LOG_TRIVIAL(warning) << "Cancelling retransmission timer failed: " << error.message();
  }
}

void TFTPRetransmissionTimer::set_handlers(ResendHandler aResend, ExpiredHandler aExpired)
{
  resend_handler = aResend;
  expired_handler = aExpired;
}

void TFTPRetransmissionTimer::arm(const TFTPBuffer& aPayload)
{
  disarm();
  payload = aPayload;
  armed = true;
  schedule();
}

void TFTPRetransmissionTimer::disarm()
{
  //Anything still queued for the old generation becomes a no-op
  ++generation;
  armed = false;
  timeout = base_timeout;
  retransmission_timer.expires_at(boost::posix_time::pos_infin);
}

//Private
void TFTPRetransmissionTimer::schedule()
{
  retransmission_timer.expires_from_now(timeout);
  retransmission_timer.async_wait(boost::bind(&TFTPRetransmissionTimer::handle_timeout,
                                              guard,
                                              generation,
                                              boost::asio::placeholders::error)
                                  );
}

//Private
void TFTPRetransmissionTimer::handle_timeout(std::shared_ptr<Guard> timer_guard, unsigned long fired_generation,
                                             const boost::system::error_code& error)
{
  if(error == boost::asio::error::operation_aborted) return;
  if(timer_guard->timer == nullptr) return;
  timer_guard->timer->fire(fired_generation);
}

//Private
//Gets called when the reply we are waiting for did not show up in time
void TFTPRetransmissionTimer::fire(unsigned long fired_generation)
{
  if(!armed || fired_generation != generation) return;

  timeout = timeout * 2;
  if(timeout > max_timeout){
    BOOST_LOG_TRIVIAL(debug) << "Retransmission delay of " << timeout.total_milliseconds()
                             << "ms exceeds " << max_timeout.total_milliseconds() << "ms";
    armed = false;
    ++generation;
    if(expired_handler) expired_handler();
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Retransmitting " << payload.size() << " bytes, next wait "
                           << timeout.total_milliseconds() << "ms";
  TFTPBuffer resend_payload = payload;
  schedule();
  if(resend_handler) resend_handler(resend_payload);
}
