// core/sessions.cpp - Subscription management implementation
#include "sessions.hpp"
#include "../utils.hpp"

namespace sparkbox {

std::string sanitize_log_line(const std::string &line) {
  std::string out;
  out.reserve(line.size());
  for (char c : line) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u <= 0x08)
      continue;
    out += c;
  }
  return out;
}

SessionHub::SessionHub(ContainerGateway &gateway,
                       std::chrono::milliseconds status_interval, int log_tail,
                       std::chrono::milliseconds host_interval,
                       HostSampler host_sampler)
    : gateway_(gateway), status_interval_(status_interval),
      log_tail_(log_tail), host_interval_(host_interval),
      host_sampler_(std::move(host_sampler)) {}

SessionHub::~SessionHub() { disconnect_all(); }

std::shared_ptr<SessionHub::Session>
SessionHub::find_session(const std::string &id) const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end())
    return nullptr;
  return it->second;
}

std::shared_ptr<SessionHub::Session>
SessionHub::open_session(const std::string &id,
                         std::unique_lock<std::mutex> &lock) {
  for (;;) {
    std::shared_ptr<Session> s;
    {
      std::lock_guard<std::mutex> map_lock(sessions_mutex_);
      auto &entry = sessions_[id];
      if (!entry)
        entry = std::make_shared<Session>();
      s = entry;
    }
    lock = std::unique_lock<std::mutex>(s->mutex);
    if (!s->closed)
      return s;
    // disconnect() won the race and already dropped s from the map
    lock.unlock();
  }
}

std::unique_ptr<SessionHub::Poller>
SessionHub::start_poller(std::chrono::milliseconds interval,
                         std::function<bool()> tick) {
  auto poller = std::make_unique<Poller>();
  Poller *raw = poller.get();
  poller->thread = std::thread([raw, interval, tick]() {
    std::unique_lock<std::mutex> lock(raw->mutex);
    while (!raw->stop) {
      lock.unlock();
      bool keep = tick();
      lock.lock();
      if (!keep)
        break;
      raw->cv.wait_for(lock, interval, [raw]() { return raw->stop; });
    }
  });
  return poller;
}

void SessionHub::stop_logs(Session &s) {
  if (!s.logs)
    return;
  s.logs->stream->close();
  if (s.logs->pump.joinable())
    s.logs->pump.join();
  LOG_DEBUG("Closed log stream for " + s.logs->container);
  s.logs.reset();
}

void SessionHub::stop_poller(std::unique_ptr<Poller> &poller) {
  if (!poller)
    return;
  {
    std::lock_guard<std::mutex> lock(poller->mutex);
    poller->stop = true;
  }
  poller->cv.notify_all();
  if (poller->thread.joinable())
    poller->thread.join();
  poller.reset();
}

void SessionHub::subscribe_logs(const std::string &session_id,
                                const std::string &container, LogSink sink) {
  std::unique_lock<std::mutex> lock;
  auto s = open_session(session_id, lock);

  stop_logs(*s);

  auto sub = std::make_unique<LogSubscription>();
  sub->container = container;
  sub->stream = gateway_.open_logs(container, log_tail_);

  LogStream *stream = sub->stream.get();
  sub->pump = std::thread([stream, container, sink]() {
    std::string pending;
    std::string chunk;
    try {
      while (stream->read(chunk)) {
        pending += chunk;
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
          sink(container, sanitize_log_line(pending.substr(0, pos + 1)));
          pending.erase(0, pos + 1);
        }
      }
      if (!pending.empty())
        sink(container, sanitize_log_line(pending));
    } catch (const std::exception &e) {
      LOG_WARN("Log delivery for " + container + " stopped: " + e.what());
    }
  });

  s->logs = std::move(sub);
  LOG_DEBUG("Session " + session_id + " following logs of " + container);
}

void SessionHub::unsubscribe_logs(const std::string &session_id) {
  auto s = find_session(session_id);
  if (!s)
    return;
  std::lock_guard<std::mutex> lock(s->mutex);
  stop_logs(*s);
}

void SessionHub::subscribe_status(const std::string &session_id,
                                  StatusSink sink, ErrorSink on_error) {
  std::unique_lock<std::mutex> lock;
  auto s = open_session(session_id, lock);

  stop_poller(s->status);

  ContainerGateway &gateway = gateway_;
  s->status = start_poller(status_interval_, [&gateway, sink, on_error]() {
    std::vector<ContainerInfo> containers;
    try {
      containers = gateway.list();
    } catch (const std::exception &e) {
      LOG_WARN("Status poll failed: " + std::string(e.what()));
      if (!on_error)
        return true;
      try {
        on_error("Failed to fetch status.");
      } catch (const std::exception &delivery) {
        LOG_WARN("Status error delivery failed: " +
                 std::string(delivery.what()));
        return false;
      }
      return true;
    }

    try {
      sink(containers);
    } catch (const std::exception &e) {
      LOG_WARN("Status delivery stopped: " + std::string(e.what()));
      return false;
    }
    return true;
  });
}

void SessionHub::unsubscribe_status(const std::string &session_id) {
  auto s = find_session(session_id);
  if (!s)
    return;
  std::lock_guard<std::mutex> lock(s->mutex);
  stop_poller(s->status);
}

void SessionHub::subscribe_host_stats(const std::string &session_id,
                                      HostStatsSink sink) {
  std::unique_lock<std::mutex> lock;
  auto s = open_session(session_id, lock);

  stop_poller(s->host_stats);

  HostSampler sampler = host_sampler_;
  s->host_stats = start_poller(host_interval_, [sampler, sink]() {
    HostStats stats;
    try {
      stats = sampler();
    } catch (const std::exception &e) {
      LOG_WARN("Host stats sample failed: " + std::string(e.what()));
      return true;
    }

    try {
      sink(stats);
    } catch (const std::exception &e) {
      LOG_WARN("Host stats delivery stopped: " + std::string(e.what()));
      return false;
    }
    return true;
  });
}

void SessionHub::unsubscribe_host_stats(const std::string &session_id) {
  auto s = find_session(session_id);
  if (!s)
    return;
  std::lock_guard<std::mutex> lock(s->mutex);
  stop_poller(s->host_stats);
}

void SessionHub::disconnect(const std::string &session_id) {
  auto s = find_session(session_id);
  if (!s)
    return;

  std::lock_guard<std::mutex> lock(s->mutex);
  stop_logs(*s);
  stop_poller(s->status);
  stop_poller(s->host_stats);
  s->closed = true;

  // Erased while s->mutex is held so no subscriber can reuse s afterwards
  std::lock_guard<std::mutex> map_lock(sessions_mutex_);
  auto it = sessions_.find(session_id);
  if (it != sessions_.end() && it->second == s)
    sessions_.erase(it);
}

void SessionHub::disconnect_all() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (const auto &entry : sessions_)
      ids.push_back(entry.first);
  }
  for (const auto &id : ids)
    disconnect(id);
}

bool SessionHub::has_log_subscription(const std::string &session_id) const {
  auto s = find_session(session_id);
  if (!s)
    return false;
  std::lock_guard<std::mutex> lock(s->mutex);
  return s->logs != nullptr;
}

bool SessionHub::has_status_subscription(const std::string &session_id) const {
  auto s = find_session(session_id);
  if (!s)
    return false;
  std::lock_guard<std::mutex> lock(s->mutex);
  return s->status != nullptr;
}

bool SessionHub::has_host_stats_subscription(
    const std::string &session_id) const {
  auto s = find_session(session_id);
  if (!s)
    return false;
  std::lock_guard<std::mutex> lock(s->mutex);
  return s->host_stats != nullptr;
}

} // namespace sparkbox
