/**
 * @file test_container_gateway.cpp
 * @brief Managed container access, stats math and session subscriptions
 *
 * Tests:
 * - Only prefixed containers are visible or controllable
 * - Identifiers resolve by exact name or unique id prefix
 * - CPU and memory percentages from two counter samples
 * - A new log subscription closes the previous stream first
 * - Unsubscribe, disconnect and hub shutdown release streams deterministically
 * - Status polling can be cancelled and reports engine failures
 * - Subscribing while the same session disconnects never strands a worker
 * - A throwing sink ends its own subscription only
 * - Host stats polling, including sampler failures
 */

#include "core/container_gateway.hpp"
#include "core/errors.hpp"
#include "core/sessions.hpp"
#include "fakes/fake_orchestrator.hpp"
#include "test_support.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace sparkbox;
using namespace sparkbox::test;
using namespace std::chrono_literals;

namespace {

void add_fleet(FakeOrchestrator &orch) {
  orch.add_container("sb-pihole", "abc123def456000000000000");
  orch.add_container("sb-unbound", "abd999888777000000000000");
  orch.add_container("postgres", "ffff00001111000000000000");
}

// Polls cond until it holds or two seconds pass.
template <typename Cond> bool eventually(Cond cond) {
  for (int i = 0; i < 200; ++i) {
    if (cond())
      return true;
    std::this_thread::sleep_for(10ms);
  }
  return cond();
}

void push_chunk(const std::shared_ptr<FakeLogStream::Shared> &shared,
                const std::string &chunk) {
  {
    std::lock_guard<std::mutex> lock(shared->mutex);
    shared->chunks.push_back(chunk);
  }
  shared->cv.notify_all();
}

} // namespace

static void test_list_filters_prefix() {
  FakeOrchestrator orch;
  add_fleet(orch);
  ContainerGateway gateway(orch, "sb-");

  auto containers = gateway.list();
  assert(containers.size() == 2);
  for (const auto &c : containers)
    assert(c.name.rfind("sb-", 0) == 0);
}

static void test_resolve() {
  FakeOrchestrator orch;
  add_fleet(orch);
  ContainerGateway gateway(orch, "sb-");

  assert(gateway.resolve("sb-pihole").id == "abc123def456000000000000");
  assert(gateway.resolve("abc1").name == "sb-pihole");
  assert(gateway.resolve("abd").name == "sb-unbound");

  // Unmanaged, ambiguous, empty and unknown identifiers
  assert(throws<NotFoundError>([&]() { gateway.resolve("postgres"); }));
  assert(throws<NotFoundError>([&]() { gateway.resolve("ffff"); }));
  assert(throws<NotFoundError>([&]() { gateway.resolve("ab"); }));
  assert(throws<NotFoundError>([&]() { gateway.resolve(""); }));
  assert(throws<NotFoundError>([&]() { gateway.resolve("sb-missing"); }));
}

static void test_operations_require_managed_container() {
  FakeOrchestrator orch;
  add_fleet(orch);
  ContainerGateway gateway(orch, "sb-");

  assert(throws<NotFoundError>([&]() { gateway.stop("postgres"); }));
  assert(throws<NotFoundError>([&]() { gateway.restart("postgres"); }));
  assert(throws<NotFoundError>([&]() { gateway.stats("postgres"); }));
  assert(throws<NotFoundError>([&]() { gateway.open_logs("postgres", 10); }));
  assert(orch.actions().empty());

  gateway.restart("sb-unbound");
  gateway.start("abc123");
  auto actions = orch.actions();
  assert(actions.size() == 2);
  assert(actions[0] == "restart:abd999888777000000000000");
  assert(actions[1] == "start:abc123def456000000000000");
}

static void test_compute_stats() {
  StatsSample sample;
  sample.precpu.total_usage = 1000000;
  sample.precpu.system_usage = 50000000;
  sample.cpu.total_usage = 1500000;
  sample.cpu.system_usage = 60000000;
  sample.cpu.online_cpus = 4;
  sample.memory_usage = 256 * 1024 * 1024;
  sample.memory_limit = 1024 * 1024 * 1024;
  sample.networks["eth0"] = {100, 200, 3, 4};

  ContainerStats stats = compute_stats(sample);
  // 0.5M / 10M * 4 * 100
  assert(stats.cpu_percent == 20.0);
  assert(stats.memory_percent == 25.0);
  assert(stats.networks.at("eth0").tx_bytes == 200);
}

static void test_compute_stats_edge_cases() {
  StatsSample idle;
  idle.cpu.total_usage = 10;
  idle.precpu.total_usage = 5;
  idle.cpu.system_usage = 100;
  idle.precpu.system_usage = 100;
  ContainerStats stats = compute_stats(idle);
  assert(stats.cpu_percent == 0.0);
  // limit 0 counts as 1
  assert(stats.memory_limit == 1);
  assert(stats.memory_percent == 0.0);

  StatsSample rounding;
  rounding.precpu.system_usage = 0;
  rounding.cpu.system_usage = 3;
  rounding.cpu.total_usage = 1;
  // online_cpus missing counts as one core: 1/3 * 100
  assert(compute_stats(rounding).cpu_percent == 33.33);

  assert(round_to(12.345678, 2) == 12.35);
}

static void test_stats_goes_through_resolution() {
  FakeOrchestrator orch;
  add_fleet(orch);
  ContainerGateway gateway(orch, "sb-");

  StatsSample sample;
  sample.memory_usage = 50;
  sample.memory_limit = 200;
  orch.set_stats(sample);

  ContainerStats stats = gateway.stats("sb-pihole");
  assert(stats.memory_percent == 25.0);
  assert(orch.actions().back() == "stats:abc123def456000000000000");
}

static void test_sanitize_log_line() {
  std::string raw = std::string("\x01\x00\x00\x00hello", 9) + "\x07 world\n";
  assert(sanitize_log_line(raw) == "hello world\n");
  assert(sanitize_log_line("tab\tkept\n") == "tab\tkept\n");
}

static void test_log_subscription_replaces_previous() {
  FakeOrchestrator orch;
  add_fleet(orch);
  ContainerGateway gateway(orch, "sb-");
  SessionHub hub(gateway, 1000ms, 50);

  std::mutex mutex;
  std::vector<std::string> lines;
  auto sink = [&](const std::string &container, const std::string &line) {
    std::lock_guard<std::mutex> lock(mutex);
    lines.push_back(container + "|" + line);
  };

  hub.subscribe_logs("s1", "sb-pihole", sink);
  auto first = orch.last_stream();
  push_chunk(first, "one\ntw");
  push_chunk(first, "o\n");
  assert(eventually([&]() {
    std::lock_guard<std::mutex> lock(mutex);
    return lines.size() == 2;
  }));
  assert(lines[0] == "sb-pihole|one\n");
  assert(lines[1] == "sb-pihole|two\n");

  hub.subscribe_logs("s1", "sb-unbound", sink);
  // The old stream was closed before the new one was opened
  assert(first->closed);
  assert(orch.open_log_streams() == 2);
  assert(orch.actions().back() == "logs:abd999888777000000000000:50");
  assert(hub.has_log_subscription("s1"));

  auto second = orch.last_stream();
  assert(!second->closed);
  hub.unsubscribe_logs("s1");
  assert(second->closed);
  assert(!hub.has_log_subscription("s1"));
}

static void test_failed_subscribe_drops_old_stream() {
  FakeOrchestrator orch;
  add_fleet(orch);
  ContainerGateway gateway(orch, "sb-");
  SessionHub hub(gateway, 1000ms, 50);

  hub.subscribe_logs("s1", "sb-pihole", [](const std::string &, const std::string &) {});
  auto first = orch.last_stream();

  assert(throws<NotFoundError>([&]() {
    hub.subscribe_logs("s1", "postgres", [](const std::string &, const std::string &) {});
  }));
  assert(first->closed);
  assert(!hub.has_log_subscription("s1"));
}

static void test_sessions_are_independent() {
  FakeOrchestrator orch;
  add_fleet(orch);
  ContainerGateway gateway(orch, "sb-");
  SessionHub hub(gateway, 1000ms, 50);
  auto noop = [](const std::string &, const std::string &) {};

  hub.subscribe_logs("a", "sb-pihole", noop);
  hub.subscribe_logs("b", "sb-pihole", noop);
  auto streams = orch.streams();
  assert(streams.size() == 2);

  hub.disconnect("a");
  assert(streams[0]->closed);
  assert(!streams[1]->closed);
  assert(!hub.has_log_subscription("a"));
  assert(hub.has_log_subscription("b"));

  // Disconnecting an unknown session is harmless
  hub.disconnect("nobody");
}

static void test_hub_shutdown_closes_streams() {
  FakeOrchestrator orch;
  add_fleet(orch);
  ContainerGateway gateway(orch, "sb-");
  std::shared_ptr<FakeLogStream::Shared> stream;
  {
    SessionHub hub(gateway, 1000ms, 50);
    hub.subscribe_logs("a", "sb-unbound", [](const std::string &, const std::string &) {});
    stream = orch.last_stream();
  }
  assert(stream->closed);
}

static void test_status_subscription() {
  FakeOrchestrator orch;
  add_fleet(orch);
  ContainerGateway gateway(orch, "sb-");
  SessionHub hub(gateway, 20ms, 50);

  std::atomic<int> updates{0};
  std::atomic<size_t> last_size{0};
  hub.subscribe_status(
      "s1",
      [&](const std::vector<ContainerInfo> &containers) {
        last_size = containers.size();
        ++updates;
      },
      nullptr);

  assert(eventually([&]() { return updates.load() >= 3; }));
  assert(last_size.load() == 2);
  assert(hub.has_status_subscription("s1"));

  hub.unsubscribe_status("s1");
  assert(!hub.has_status_subscription("s1"));
  int after = updates.load();
  std::this_thread::sleep_for(100ms);
  assert(updates.load() == after);
}

static void test_status_reports_errors() {
  FakeOrchestrator orch;
  add_fleet(orch);
  orch.fail_list(true);
  ContainerGateway gateway(orch, "sb-");
  SessionHub hub(gateway, 20ms, 50);

  std::atomic<int> errors{0};
  hub.subscribe_status(
      "s1", [](const std::vector<ContainerInfo> &) { assert(false); },
      [&](const std::string &message) {
        assert(!message.empty());
        ++errors;
      });
  assert(eventually([&]() { return errors.load() >= 2; }));
  hub.disconnect("s1");
}

static void test_concurrent_status_polling() {
  FakeOrchestrator orch;
  add_fleet(orch);
  ContainerGateway gateway(orch, "sb-");
  SessionHub hub(gateway, 10ms, 50);

  std::atomic<int> updates{0};
  for (int i = 0; i < 5; ++i) {
    hub.subscribe_status(
        "s" + std::to_string(i),
        [&](const std::vector<ContainerInfo> &) { ++updates; }, nullptr);
  }
  assert(eventually([&]() { return updates.load() >= 20; }));
  hub.disconnect_all();
  assert(!hub.has_status_subscription("s0"));
}

static void test_subscribe_racing_disconnect() {
  FakeOrchestrator orch;
  add_fleet(orch);
  ContainerGateway gateway(orch, "sb-");
  SessionHub hub(gateway, 1000ms, 50);

  std::atomic<bool> in_sink{false};
  hub.subscribe_logs("s1", "sb-pihole",
                     [&](const std::string &, const std::string &) {
                       in_sink = true;
                       std::this_thread::sleep_for(300ms);
                     });
  auto first = orch.last_stream();
  push_chunk(first, "line\n");
  assert(eventually([&]() { return in_sink.load(); }));

  // disconnect waits for the busy pump; the subscribe arrives meanwhile
  std::thread closer([&]() { hub.disconnect("s1"); });
  std::this_thread::sleep_for(50ms);
  std::thread subscriber([&]() {
    hub.subscribe_logs("s1", "sb-unbound",
                       [](const std::string &, const std::string &) {});
  });
  closer.join();
  subscriber.join();

  assert(first->closed);
  assert(hub.has_log_subscription("s1"));
  auto second = orch.last_stream();
  assert(second != first);
  assert(!second->closed);

  hub.disconnect("s1");
  assert(second->closed);
}

static void test_subscribe_disconnect_stress() {
  FakeOrchestrator orch;
  add_fleet(orch);
  ContainerGateway gateway(orch, "sb-");
  SessionHub hub(gateway, 5ms, 50);
  auto noop = [](const std::string &, const std::string &) {};

  for (int i = 0; i < 50; ++i) {
    std::thread a([&]() { hub.subscribe_logs("s", "sb-pihole", noop); });
    std::thread b([&]() { hub.disconnect("s"); });
    std::thread c([&]() {
      hub.subscribe_status("s", [](const std::vector<ContainerInfo> &) {},
                           nullptr);
    });
    a.join();
    b.join();
    c.join();
  }
  hub.disconnect_all();
  for (const auto &stream : orch.streams())
    assert(stream->closed);
}

static void test_throwing_sink_ends_own_subscription() {
  FakeOrchestrator orch;
  add_fleet(orch);
  ContainerGateway gateway(orch, "sb-");
  SessionHub hub(gateway, 10ms, 50);

  std::atomic<int> log_calls{0};
  hub.subscribe_logs("s1", "sb-pihole",
                     [&](const std::string &, const std::string &) {
                       ++log_calls;
                       throw std::runtime_error("client went away");
                     });
  auto stream = orch.last_stream();
  push_chunk(stream, "one\ntwo\n");
  assert(eventually([&]() { return log_calls.load() == 1; }));

  std::atomic<int> status_calls{0};
  hub.subscribe_status(
      "s1",
      [&](const std::vector<ContainerInfo> &) {
        ++status_calls;
        throw std::runtime_error("client went away");
      },
      nullptr);
  std::atomic<int> other_calls{0};
  hub.subscribe_status(
      "s2", [&](const std::vector<ContainerInfo> &) { ++other_calls; },
      nullptr);

  assert(eventually([&]() { return other_calls.load() >= 5; }));
  assert(log_calls.load() == 1);
  assert(status_calls.load() == 1);

  hub.unsubscribe_logs("s1");
  assert(stream->closed);
  hub.disconnect_all();
}

static void test_host_stats_subscription() {
  FakeOrchestrator orch;
  ContainerGateway gateway(orch, "sb-");
  std::atomic<int> samples{0};
  SessionHub hub(gateway, 1000ms, 50, 10ms, [&]() {
    HostStats stats;
    stats.cpu_percent = 12.5;
    stats.cpu_cores = 4;
    // Every other sample fails
    if (++samples % 2 == 0)
      throw std::runtime_error("/proc unavailable");
    return stats;
  });

  std::atomic<int> updates{0};
  hub.subscribe_host_stats("s1", [&](const HostStats &stats) {
    assert(stats.cpu_percent == 12.5);
    assert(stats.cpu_cores == 4);
    ++updates;
  });
  assert(hub.has_host_stats_subscription("s1"));
  assert(eventually([&]() { return updates.load() >= 3; }));
  assert(samples.load() >= 5);

  hub.unsubscribe_host_stats("s1");
  assert(!hub.has_host_stats_subscription("s1"));
  int after = samples.load();
  std::this_thread::sleep_for(60ms);
  assert(samples.load() == after);

  hub.subscribe_host_stats("s1", [](const HostStats &) {});
  hub.disconnect("s1");
  assert(!hub.has_host_stats_subscription("s1"));
}

int main() {
  std::cout << "=== Container Gateway Tests ===" << std::endl;

  RUN_TEST(test_list_filters_prefix);
  RUN_TEST(test_resolve);
  RUN_TEST(test_operations_require_managed_container);
  RUN_TEST(test_compute_stats);
  RUN_TEST(test_compute_stats_edge_cases);
  RUN_TEST(test_stats_goes_through_resolution);
  RUN_TEST(test_sanitize_log_line);
  RUN_TEST(test_log_subscription_replaces_previous);
  RUN_TEST(test_failed_subscribe_drops_old_stream);
  RUN_TEST(test_sessions_are_independent);
  RUN_TEST(test_hub_shutdown_closes_streams);
  RUN_TEST(test_status_subscription);
  RUN_TEST(test_status_reports_errors);
  RUN_TEST(test_concurrent_status_polling);
  RUN_TEST(test_subscribe_racing_disconnect);
  RUN_TEST(test_subscribe_disconnect_stress);
  RUN_TEST(test_throwing_sink_ends_own_subscription);
  RUN_TEST(test_host_stats_subscription);

  std::cout << "=== All container gateway tests passed ===" << std::endl;
  return 0;
}
