#include "fanout_cache/fanout_cache.hpp"

#include "test_util.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

using namespace fanout_cache;
using fanout_cache::testing::bytes;
using fanout_cache::testing::TempDir;
using fanout_cache::testing::text;

namespace {

CacheOptions race_options() {
  CacheOptions o;
  o.shards = 4;
  o.timeout = std::chrono::milliseconds(5);
  o.settings["fsync"] = "never";
  return o;
}

// Child body: waits for the start signal, then races one add. Exit status 0
// means this child stored its value.
[[noreturn]] void run_child(const std::string &dir, int start_fd, int id) {
  char go = 0;
  if (::read(start_fd, &go, 1) < 0)
    ::_exit(3);
  int status = 2;
  try {
    FanoutCache cache(dir, race_options());
    SetOptions so;
    so.retry = true;
    status = cache.add("race", bytes("value-" + std::to_string(id)), so) ? 0 : 1;
  } catch (const std::exception &) {
    status = 2;
  }
  ::_exit(status);
}

} // namespace

TEST_CASE("concurrent adds across processes have one winner",
          "[multiprocess][add]") {
  TempDir dir("multiprocess_add");
  { FanoutCache init(dir.str(), race_options()); }

  int start[2];
  REQUIRE(::pipe(start) == 0);
  constexpr int kChildren = 8;
  std::vector<pid_t> pids;
  for (int i = 0; i < kChildren; ++i) {
    const pid_t pid = ::fork();
    REQUIRE(pid >= 0);
    if (pid == 0) {
      ::close(start[1]);
      run_child(dir.str(), start[0], i);
    }
    pids.push_back(pid);
  }
  ::close(start[0]);
  // Closing the write end releases every child at once.
  ::close(start[1]);

  int winners = 0;
  int winner = -1;
  for (int i = 0; i < kChildren; ++i) {
    int status = 0;
    REQUIRE(::waitpid(pids[i], &status, 0) == pids[i]);
    REQUIRE(WIFEXITED(status));
    const int code = WEXITSTATUS(status);
    REQUIRE(code <= 1);
    if (code == 0) {
      ++winners;
      winner = i;
    }
  }
  CHECK(winners == 1);

  FanoutCache cache(dir.str(), race_options());
  CHECK(text(cache.at("race")) == "value-" + std::to_string(winner));
  CHECK(cache.size() == 1);
}

TEST_CASE("concurrent adds across threads have one winner",
          "[multiprocess][threads]") {
  TempDir dir("threads_add");
  FanoutCache shared(dir.str(), race_options());
  FanoutCache second(dir.str(), race_options());

  std::atomic<int> winners{0};
  std::atomic<int> winner{-1};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      FanoutCache &cache = (i % 2 == 0) ? shared : second;
      SetOptions so;
      so.retry = true;
      if (cache.add("race", bytes("t" + std::to_string(i)), so)) {
        ++winners;
        winner = i;
      }
    });
  }
  for (auto &t : threads)
    t.join();

  CHECK(winners == 1);
  CHECK(text(shared.at("race")) == "t" + std::to_string(winner.load()));
  CHECK(text(second.at("race")) == "t" + std::to_string(winner.load()));
}

TEST_CASE("writers in many threads lose nothing", "[multiprocess][threads]") {
  TempDir dir("threads_set");
  FanoutCache cache(dir.str(), race_options());
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&cache, t] {
      SetOptions so;
      so.retry = true;
      for (int i = 0; i < 50; ++i)
        cache.set("t" + std::to_string(t) + "-" + std::to_string(i),
                  bytes(std::to_string(i)), so);
    });
  }
  for (auto &th : threads)
    th.join();
  CHECK(cache.size() == 200);
  CHECK(text(cache.at("t3-49")) == "49");
  CHECK(cache.clear() == 200);
}
