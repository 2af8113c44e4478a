#ifndef TFTPD_TRANSFER_HPP
#define TFTPD_TRANSFER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "tftpd/transport.hpp"

namespace tftpd {

// How an inbound datagram relates to the exchange waiting for it.
enum class Verdict {
  Accept,    // the packet we were waiting for
  Retry,     // stale or unexpected; counts as a failed attempt
  PeerError, // peer sent ERROR; stop at once
  Illegal,   // protocol violation; stop at once
};

enum class ExchangeStatus { Accepted, PeerError, Illegal, Exhausted };

struct ExchangeResult {
  ExchangeStatus status = ExchangeStatus::Exhausted;
  std::vector<char> packet; // the deciding datagram, empty when Exhausted
  int attempts = 0;
};

using Classifier = std::function<Verdict(const char *buffer, size_t size)>;

// Lock-step retry combinator shared by both transfer directions.
//
// Each attempt sends `outbound` (skipped when empty) and waits up to
// `timeout` for one datagram, which `classify` judges. A timeout or a Retry
// verdict uses up the attempt; the same bytes go out again until
// `max_attempts` attempts have been made, then the result is Exhausted.
// Transport failures propagate as std::runtime_error.
ExchangeResult exchange(Transport &transport, const std::vector<char> &outbound,
                        const Classifier &classify, int max_attempts,
                        std::chrono::milliseconds timeout);

// Download side: accept ACK(block) only.
Classifier expect_ack(uint16_t block);

// Upload side: accept any DATA; anything else but ERROR is illegal.
Classifier expect_data();

} // namespace tftpd

#endif // TFTPD_TRANSFER_HPP
