#include "zmq_publisher.hpp"
#include "../logging/log_helper.hpp"
#include <cstring>
#include <cerrno>
#include <stdexcept>

ZmqPublisher::ZmqPublisher(const std::string& bind_endpoint, int hwm)
  : ctx_(nullptr), pub_(nullptr), endpoint_(bind_endpoint), hwm_(hwm), bound_(false) {
  ctx_ = zmq_ctx_new();
  if (!ctx_) {
    throw std::runtime_error("Failed to create ZMQ context");
  }

  pub_ = zmq_socket(ctx_, ZMQ_PUB);
  if (!pub_) {
    std::string err = zmq_strerror(zmq_errno());
    zmq_ctx_term(ctx_);
    ctx_ = nullptr;
    throw std::runtime_error("Failed to create ZMQ socket: " + err);
  }

  zmq_setsockopt(pub_, ZMQ_SNDHWM, &hwm_, sizeof(hwm_));

  // Do not let a stuck close block shutdown
  int linger = 0;
  zmq_setsockopt(pub_, ZMQ_LINGER, &linger, sizeof(linger));

  bind();
}

ZmqPublisher::~ZmqPublisher() {
  if (pub_) {
    zmq_close(pub_);
    pub_ = nullptr;
  }
  if (ctx_) {
    zmq_ctx_term(ctx_);
    ctx_ = nullptr;
  }
}

bool ZmqPublisher::bind() {
  std::lock_guard<std::mutex> lock(send_mutex_);
  if (!pub_) return false;
  if (bound_.load()) return true;
  if (zmq_bind(pub_, endpoint_.c_str()) != 0) {
    LOG_ERROR_COMP("ZMQ_PUBLISHER", "Failed to bind to: " + endpoint_ + " (" + zmq_strerror(zmq_errno()) + ")");
    return false;
  }
  LOG_INFO_COMP("ZMQ_PUBLISHER", "Trade tap bound to: " + endpoint_);
  bound_.store(true);
  return true;
}

bool ZmqPublisher::send(const std::string& topic, const void* data, size_t size) {
  if (!bound_.load()) return false;

  std::lock_guard<std::mutex> lock(send_mutex_);

  if (zmq_send(pub_, topic.data(), topic.size(), ZMQ_SNDMORE | ZMQ_DONTWAIT) == -1) {
    int err = zmq_errno();
    if (err == EAGAIN) {
      messages_dropped_.fetch_add(1);
    } else {
      LOG_ERROR_COMP("ZMQ_PUBLISHER", "Failed to send topic frame: " + std::string(zmq_strerror(err)));
    }
    return false;
  }

  // Once the first frame is queued the remaining frames of the message are
  // always accepted, so only a hard error can fail here
  if (zmq_send(pub_, data, size, ZMQ_DONTWAIT) == -1) {
    int err = zmq_errno();
    LOG_ERROR_COMP("ZMQ_PUBLISHER", "Failed to send payload for topic " + topic + ": " + zmq_strerror(err));
    return false;
  }

  messages_sent_.fetch_add(1);
  return true;
}
