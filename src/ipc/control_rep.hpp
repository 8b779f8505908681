#pragma once
#include <zmq.h>
#include <string>

/**
 * @brief ZeroMQ operator command responder
 *
 * Receives JSON commands from operator panels and sends one JSON reply
 * per request (REQ/REP).
 *
 * Requests:
 * - {"target":"FeedPumpPump","value":true}
 * - {"target":"FeedValve","value":-1}
 * - {"target":"LevelValveControlCommand","value":"AUTOMATIC"}
 * - {"cmd":"get_status"} / {"cmd":"stop"}
 */
struct ControlRep {
  void* ctx{nullptr};  ///< ZeroMQ context
  void* rep{nullptr};  ///< ZeroMQ REP socket
  std::string endpoint;
  std::string last_error;
  bool connected{false};

  /**
   * @brief Create and bind the responder socket
   * @param ep Bind endpoint, e.g. "tcp://127.0.0.1:5555"
   */
  explicit ControlRep(const std::string& ep = "tcp://127.0.0.1:5555") : endpoint(ep) {
    ctx = zmq_ctx_new();
    rep = zmq_socket(ctx, ZMQ_REP);
    int linger = 0;
    zmq_setsockopt(rep, ZMQ_LINGER, &linger, sizeof(linger));
    if (zmq_bind(rep, endpoint.c_str()) == 0) {
      connected = true;
    } else {
      last_error = zmq_strerror(zmq_errno());
    }
  }

  ~ControlRep() {
    zmq_close(rep);
    zmq_ctx_term(ctx);
  }

  ControlRep(const ControlRep&) = delete;
  ControlRep& operator=(const ControlRep&) = delete;

  bool is_connected() const { return connected; }
  const std::string& get_bind_address() const { return endpoint; }

  /**
   * @brief Check for a pending request
   * @param timeout_ms Poll timeout, 0 returns immediately
   */
  bool has_request(long timeout_ms = 0) {
    zmq_pollitem_t items[] = {{rep, 0, ZMQ_POLLIN, 0}};
    if (zmq_poll(items, 1, timeout_ms) <= 0) {
      return false;
    }
    return (items[0].revents & ZMQ_POLLIN) != 0;
  }

  /**
   * @brief Receive one request (blocking). Caller must reply.
   */
  std::string recv() {
    char buf[4096];
    int n = zmq_recv(rep, buf, sizeof(buf), 0);
    if (n < 0) {
      last_error = zmq_strerror(zmq_errno());
      return std::string();
    }
    // zmq_recv reports the full size of truncated messages
    if (n > static_cast<int>(sizeof(buf))) n = sizeof(buf);
    return std::string(buf, buf + n);
  }

  /**
   * @brief Send the reply to the last request
   */
  bool reply(const std::string& s) {
    if (zmq_send(rep, s.data(), s.size(), 0) < 0) {
      last_error = zmq_strerror(zmq_errno());
      return false;
    }
    return true;
  }
};
