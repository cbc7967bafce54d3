#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <cstdint>
#include <zmq.h>

/**
 * ZeroMQ PUB socket for the low-latency trade tap
 * 
 * Each message is two frames: topic, then payload. Sends never block:
 * if the high water mark is reached the message is dropped and counted.
 * A ZMQ socket is not thread-safe, so sends are serialized internally and
 * the publisher can be shared by every connection thread.
 */
class ZmqPublisher {
public:
  /**
   * @param bind_endpoint ZMQ endpoint to bind to (e.g., "tcp://*:5556")
   * @param hwm High water mark (maximum queued messages per subscriber)
   * 
   * @throws std::runtime_error if ZMQ context or socket creation fails
   */
  explicit ZmqPublisher(const std::string& bind_endpoint, int hwm = 1000);
  ~ZmqPublisher();

  // Non-copyable
  ZmqPublisher(const ZmqPublisher&) = delete;
  ZmqPublisher& operator=(const ZmqPublisher&) = delete;

  /**
   * Bind to the configured endpoint; called by the constructor
   * 
   * @return true if bound (now or earlier), false otherwise
   */
  bool bind();
  bool is_bound() const { return bound_.load(); }
  const std::string& get_endpoint() const { return endpoint_; }

  /**
   * Send topic + binary payload
   * 
   * @return true if message was queued, false if dropped or error occurred
   */
  bool send(const std::string& topic, const void* data, size_t size);

  bool publish(const std::string& topic, const std::string& payload) {
    return send(topic, payload.data(), payload.size());
  }

  // Statistics
  uint64_t get_messages_sent() const { return messages_sent_.load(); }
  uint64_t get_messages_dropped() const { return messages_dropped_.load(); }

private:
  void* ctx_;
  void* pub_;
  std::string endpoint_;
  int hwm_;
  std::atomic<bool> bound_;
  std::mutex send_mutex_;

  std::atomic<uint64_t> messages_sent_{0};
  std::atomic<uint64_t> messages_dropped_{0};
};
