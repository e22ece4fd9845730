#pragma once

#include "solo/codec.hpp"
#include "solo/socket.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace solo_test {

// A port that was free a moment ago.
uint16_t freePort();

// Polls `predicate` until it holds or `timeout` expires.
bool waitFor(const std::function<bool()> &predicate,
             std::chrono::milliseconds timeout = std::chrono::seconds(3));

// Sends raw bytes the way a hand-written client would.
bool sendRaw(uint16_t port, const std::string &message);

// True if the endpoint can be taken right now (the taken socket is closed
// again before returning).
bool canAcquire(uint16_t port, const std::string &address = "127.0.0.1");

} // namespace solo_test
