#pragma once
#include <zmq.h>
#include <cstdint>
#include <string>

/**
 * @brief ZeroMQ telemetry and event publisher
 *
 * Two-part messages: topic frame, then JSON body.
 * - "telemetry": one TelemetryFrame per loop cycle
 * - "event": {"name": ..., "old": ..., "new": ...} per state change
 */
struct TelemetryPub {
  void* ctx{nullptr};  ///< ZeroMQ context
  void* pub{nullptr};  ///< ZeroMQ PUB socket
  std::string endpoint;
  std::string last_error;
  bool connected{false};
  uint64_t sent{0};
  uint64_t send_errors{0};

  /**
   * @brief Create and bind the publisher socket
   * @param ep Bind endpoint, e.g. "tcp://127.0.0.1:5556"
   */
  explicit TelemetryPub(const std::string& ep = "tcp://127.0.0.1:5556") : endpoint(ep) {
    ctx = zmq_ctx_new();
    pub = zmq_socket(ctx, ZMQ_PUB);
    int linger = 0;
    zmq_setsockopt(pub, ZMQ_LINGER, &linger, sizeof(linger));
    if (zmq_bind(pub, endpoint.c_str()) == 0) {
      connected = true;
    } else {
      last_error = zmq_strerror(zmq_errno());
    }
  }

  ~TelemetryPub() {
    zmq_close(pub);
    zmq_ctx_term(ctx);
  }

  TelemetryPub(const TelemetryPub&) = delete;
  TelemetryPub& operator=(const TelemetryPub&) = delete;

  bool is_connected() const { return connected; }
  const std::string& get_bind_address() const { return endpoint; }

  /**
   * @brief Publish a message on a topic
   * @param topic Topic frame, e.g. "telemetry"
   * @param s JSON body
   */
  bool send(const std::string& topic, const std::string& s) {
    if (zmq_send(pub, topic.data(), topic.size(), ZMQ_SNDMORE) < 0 ||
        zmq_send(pub, s.data(), s.size(), 0) < 0) {
      last_error = zmq_strerror(zmq_errno());
      send_errors++;
      return false;
    }
    sent++;
    return true;
  }
};
