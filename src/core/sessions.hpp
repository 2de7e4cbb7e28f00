// core/sessions.hpp - Per-client log, status and host stats subscriptions
#pragma once

#include "container_gateway.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sparkbox {

using LogSink =
    std::function<void(const std::string &container, const std::string &line)>;
using StatusSink = std::function<void(const std::vector<ContainerInfo> &)>;
using HostStatsSink = std::function<void(const HostStats &)>;
using ErrorSink = std::function<void(const std::string &message)>;
using HostSampler = std::function<HostStats()>;

// Removes \x00-\x08 left over from stream framing.
std::string sanitize_log_line(const std::string &line);

// Each client session holds at most one log subscription, one status
// subscription and one host stats subscription. Replacing, unsubscribing and
// disconnecting all close the underlying stream and join its worker before
// returning. A sink that throws ends its own subscription's deliveries only.
class SessionHub {
public:
  SessionHub(ContainerGateway &gateway, std::chrono::milliseconds status_interval,
             int log_tail,
             std::chrono::milliseconds host_interval = std::chrono::seconds(3),
             HostSampler host_sampler = read_host_stats);
  ~SessionHub();

  SessionHub(const SessionHub &) = delete;
  SessionHub &operator=(const SessionHub &) = delete;

  // Throws NotFoundError if the container does not resolve. Any previous
  // log subscription of the session is closed first, even on failure.
  void subscribe_logs(const std::string &session, const std::string &container,
                      LogSink sink);
  void unsubscribe_logs(const std::string &session);

  void subscribe_status(const std::string &session, StatusSink sink,
                        ErrorSink on_error);
  void unsubscribe_status(const std::string &session);

  // Sampling failures are logged and skipped; the next tick retries.
  void subscribe_host_stats(const std::string &session, HostStatsSink sink);
  void unsubscribe_host_stats(const std::string &session);

  void disconnect(const std::string &session);
  void disconnect_all();

  bool has_log_subscription(const std::string &session) const;
  bool has_status_subscription(const std::string &session) const;
  bool has_host_stats_subscription(const std::string &session) const;

private:
  struct LogSubscription {
    std::string container;
    std::unique_ptr<LogStream> stream;
    std::thread pump;
  };

  // Runs tick() immediately and then once per interval until stopped or
  // tick() returns false.
  struct Poller {
    std::mutex mutex;
    std::condition_variable cv;
    bool stop = false;
    std::thread thread;
  };

  struct Session {
    mutable std::mutex mutex; // serializes subscribe/unsubscribe
    bool closed = false;      // set by disconnect before leaving the map
    std::unique_ptr<LogSubscription> logs;
    std::unique_ptr<Poller> status;
    std::unique_ptr<Poller> host_stats;
  };

  std::shared_ptr<Session> find_session(const std::string &id) const;
  // Returns the live session for id, creating it if needed, with its mutex
  // held by lock. Never returns a session that disconnect already closed.
  std::shared_ptr<Session> open_session(const std::string &id,
                                        std::unique_lock<std::mutex> &lock);

  static std::unique_ptr<Poller> start_poller(std::chrono::milliseconds interval,
                                              std::function<bool()> tick);
  static void stop_logs(Session &s);
  static void stop_poller(std::unique_ptr<Poller> &poller);

  ContainerGateway &gateway_;
  std::chrono::milliseconds status_interval_;
  int log_tail_;
  std::chrono::milliseconds host_interval_;
  HostSampler host_sampler_;

  mutable std::mutex sessions_mutex_;
  std::map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace sparkbox
