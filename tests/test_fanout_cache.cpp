#include "fanout_cache/errors.hpp"
#include "fanout_cache/fanout_cache.hpp"

#include "fake_shard.hpp"
#include "test_util.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace fanout_cache;
using fanout_cache::testing::bytes;
using fanout_cache::testing::fake_factory;
using fanout_cache::testing::FakeShard;
using fanout_cache::testing::ScriptedSweep;
using fanout_cache::testing::TempDir;
using fanout_cache::testing::text;

namespace {

CacheOptions disk_options(std::size_t shards) {
  CacheOptions o;
  o.shards = shards;
  o.timeout = std::chrono::milliseconds(50);
  o.settings["fsync"] = "never";
  return o;
}

CacheOptions fake_options(std::size_t shards, std::vector<FakeShard *> &out) {
  CacheOptions o;
  o.shards = shards;
  o.shard_factory = fake_factory(out);
  return o;
}

} // namespace

TEST_CASE("clear counts items across shards", "[fanout][e2e]") {
  TempDir dir("fanout_clear");
  FanoutCache cache(dir.str(), disk_options(4));
  REQUIRE(cache.shard_index("a") != cache.shard_index("b"));

  REQUIRE(cache.set("a", bytes("1")));
  REQUIRE(cache.set("b", bytes("2")));
  CHECK(cache.size() == 2);
  CHECK(cache.clear() == 2);
  CHECK(text(cache.get("a", bytes("-1"))) == "-1");
  CHECK(cache.size() == 0);
}

TEST_CASE("add stores only the first value", "[fanout][e2e]") {
  TempDir dir("fanout_add");
  FanoutCache cache(dir.str(), disk_options(4));
  CHECK(cache.add("x", bytes("1")));
  CHECK_FALSE(cache.add("x", bytes("2")));
  auto item = cache.get("x");
  REQUIRE(item.has_value());
  CHECK(text(item->value) == "1");
}

TEST_CASE("named and subscript deletion differ on missing keys",
          "[fanout][delete]") {
  TempDir dir("fanout_delete");
  FanoutCache cache(dir.str(), disk_options(4));
  CHECK_FALSE(cache.del("missing"));
  CHECK_THROWS_AS(cache.erase("missing"), NotFound);
  CHECK_THROWS_AS(cache.at("missing"), NotFound);
  CHECK_THROWS_AS(cache.read("missing"), NotFound);
  try {
    cache.at("missing");
    FAIL("at should throw for a missing key");
  } catch (const NotFound &e) {
    CHECK(e.key() == "missing");
  }

  cache.assign("k", bytes("v"));
  CHECK(text(cache.at("k")) == "v");
  cache.erase("k");
  CHECK_FALSE(cache.contains("k"));

  REQUIRE(cache.set("k", bytes("v")));
  CHECK(cache.del("k", true));
  CHECK_FALSE(cache.del("k", true));
}

TEST_CASE("get returns value with expire time and tag", "[fanout][get]") {
  TempDir dir("fanout_get");
  FanoutCache cache(dir.str(), disk_options(4));
  SetOptions so;
  so.ttl_ms = 60000;
  so.tag = "color";
  REQUIRE(cache.set("k", bytes("v"), so));

  GetOptions all;
  all.expire_time = true;
  all.tag = true;
  auto item = cache.get("k", all);
  REQUIRE(item.has_value());
  CHECK(text(item->value) == "v");
  CHECK(item->expire_time.has_value());
  CHECK(item->tag == std::optional<std::string>("color"));

  CHECK_FALSE(cache.get("absent", all).has_value());

  auto stream = cache.read("k");
  REQUIRE(stream);
  std::ostringstream got;
  got << stream->rdbuf();
  CHECK(got.str() == "v");
}

TEST_CASE("shards live in numbered directories", "[fanout][layout]") {
  TempDir dir("fanout_layout");
  {
    FanoutCache cache(dir.str(), disk_options(3));
    CHECK(cache.shard_count() == 3);
    REQUIRE(cache.set("k", bytes("v")));
  }
  for (const char *name : {"000", "001", "002"})
    CHECK(std::filesystem::is_directory(dir.sub(name)));
  CHECK_FALSE(std::filesystem::exists(dir.sub("003")));

  std::ifstream layout(dir.sub("fanout.txt"));
  std::stringstream ss;
  ss << layout.rdbuf();
  CHECK(ss.str().find("shards=3") != std::string::npos);
  CHECK(ss.str().find(std::string("hash=") + kRouteHashName) !=
        std::string::npos);

  FanoutCache reopened(dir.str(), disk_options(3));
  CHECK(text(reopened.at("k")) == "v");
  CHECK(reopened.volume() > 0);
  CHECK(reopened.check().empty());
}

TEST_CASE("timeouts become no-effect results unless retried",
          "[fanout][retry]") {
  TempDir dir("fanout_fake_retry");
  std::vector<FakeShard *> shards;
  FanoutCache cache(dir.str(), fake_options(4, shards));
  REQUIRE(shards.size() == 4);
  FakeShard &a = *shards[cache.shard_index("a")];

  a.timeouts = 1;
  CHECK_FALSE(cache.set("a", bytes("1")));
  a.timeouts = 1;
  CHECK_FALSE(cache.add("a", bytes("1")));
  CHECK(a.data.empty());

  SetOptions retry;
  retry.retry = true;
  a.timeouts = 3;
  CHECK(cache.set("a", bytes("1"), retry));
  CHECK(a.timeouts == 0);

  a.timeouts = 1;
  CHECK_FALSE(cache.get("a").has_value());
  GetOptions get_retry;
  get_retry.retry = true;
  a.timeouts = 2;
  CHECK(cache.get("a", get_retry).has_value());
  a.timeouts = 1;
  CHECK(text(cache.get("a", bytes("dflt"))) == "dflt");

  a.timeouts = 1;
  CHECK_FALSE(cache.del("a"));
  CHECK(a.data.contains("a"));
  a.timeouts = 2;
  CHECK(cache.del("a", true));
}

TEST_CASE("subscript forms always retry", "[fanout][retry]") {
  TempDir dir("fanout_fake_subscript");
  std::vector<FakeShard *> shards;
  FanoutCache cache(dir.str(), fake_options(4, shards));
  FakeShard &a = *shards[cache.shard_index("a")];

  a.timeouts = 5;
  cache.assign("a", bytes("1"));
  CHECK(text(a.data.at("a").value) == "1");

  a.timeouts = 2;
  cache.erase("a");
  CHECK(a.data.empty());

  a.timeouts = 2;
  CHECK_THROWS_AS(cache.erase("a"), NotFound);

  REQUIRE(cache.set("a", bytes("r")));
  a.timeouts = 2;
  CHECK(cache.read("a") != nullptr);
}

TEST_CASE("membership test lets timeouts through", "[fanout][contains]") {
  TempDir dir("fanout_fake_contains");
  std::vector<FakeShard *> shards;
  FanoutCache cache(dir.str(), fake_options(4, shards));
  FakeShard &x = *shards[cache.shard_index("x")];
  x.timeouts = 1;
  CHECK_THROWS_AS(cache.contains("x"), Timeout);
  CHECK(x.calls == 1);
  CHECK_FALSE(cache.contains("x"));
}

TEST_CASE("streamed values are replayed on retry", "[fanout][retry]") {
  TempDir dir("fanout_fake_stream");
  std::vector<FakeShard *> shards;
  FanoutCache cache(dir.str(), fake_options(2, shards));
  const std::string key = "streamed";
  FakeShard &s = *shards[cache.shard_index(key)];

  SetOptions retry;
  retry.retry = true;
  std::istringstream in("payload");
  s.timeouts = 2;
  REQUIRE(cache.set(key, in, retry));
  CHECK(text(s.data.at(key).value) == "payload");

  std::istringstream again("second");
  shards[cache.shard_index(key + "2")]->timeouts = 1;
  CHECK_FALSE(cache.add(key + "2", again));
}

TEST_CASE("expire uses one timestamp for every shard", "[fanout][sweep]") {
  TempDir dir("fanout_fake_expire");
  std::vector<FakeShard *> shards;
  FanoutCache cache(dir.str(), fake_options(4, shards));
  shards[0]->sweep_script = {ScriptedSweep{2}, ScriptedSweep{0}};
  shards[2]->sweep_script = {ScriptedSweep{-1, 1}, ScriptedSweep{0}};

  const auto before = Clock::now();
  CHECK(cache.expire() == 3);
  const auto after = Clock::now();

  const TimePoint first = shards[0]->expire_times.front();
  CHECK(first >= before);
  CHECK(first <= after);
  for (auto *s : shards) {
    REQUIRE_FALSE(s->expire_times.empty());
    for (auto t : s->expire_times)
      CHECK(t == first);
  }
  CHECK(shards[2]->expire_times.size() == 2);
}

TEST_CASE("evict and clear reach every shard", "[fanout][sweep]") {
  TempDir dir("fanout_fake_evict");
  std::vector<FakeShard *> shards;
  FanoutCache cache(dir.str(), fake_options(3, shards));
  shards[1]->sweep_script = {ScriptedSweep{-1, 4}, ScriptedSweep{0}};
  CHECK(cache.evict("old") == 4);
  for (auto *s : shards)
    CHECK(s->evicted_tags.front() == "old");

  shards[0]->sweep_script = {ScriptedSweep{1}, ScriptedSweep{0}};
  shards[2]->sweep_script = {ScriptedSweep{-1, 0}, ScriptedSweep{-1, 2},
                             ScriptedSweep{0}};
  CHECK(cache.clear() == 3);
}

TEST_CASE("aggregators sum over shards", "[fanout][aggregate]") {
  TempDir dir("fanout_fake_aggregate");
  std::vector<FakeShard *> shards;
  FanoutCache cache(dir.str(), fake_options(3, shards));
  for (std::size_t i = 0; i < shards.size(); ++i) {
    shards[i]->hit_stats = HitStats{i + 1, 10 * (i + 1)};
    shards[i]->bytes = 100;
  }
  shards[1]->warnings = {"one", "two"};
  shards[2]->warnings = {"three"};

  auto stats = cache.stats();
  CHECK(stats.hits == 6);
  CHECK(stats.misses == 60);
  CHECK(cache.volume() == 300);
  CHECK(cache.check() == std::vector<std::string>{"one", "two", "three"});

  REQUIRE(cache.set("a", bytes("1")));
  REQUIRE(cache.set("b", bytes("2")));
  CHECK(cache.size() == 2);

  shards[1]->timeouts = 1;
  CHECK_THROWS_AS(cache.size(), Timeout);
}

TEST_CASE("settings broadcast returns the last shard's answer",
          "[fanout][settings]") {
  TempDir dir("fanout_fake_reset");
  std::vector<FakeShard *> shards;
  FanoutCache cache(dir.str(), fake_options(3, shards));
  shards[0]->reset_answer = "first";
  shards[1]->reset_answer = "middle";
  shards[2]->reset_answer = "last";
  shards[1]->timeouts = 2;
  CHECK(cache.reset("sweep_batch", std::string("5")) == "last");
  for (auto *s : shards)
    CHECK(s->current.sweep_batch == 5);

  cache.create_tag_index();
  for (auto *s : shards)
    CHECK(s->current.tag_index);
  CHECK(cache.settings().tag_index);
  cache.drop_tag_index();
  CHECK_FALSE(shards[2]->current.tag_index);

  cache.close();
  for (auto *s : shards)
    CHECK(s->closed);
}

TEST_CASE("backoff runs between retries", "[fanout][retry]") {
  TempDir dir("fanout_fake_backoff");
  std::vector<FakeShard *> shards;
  std::vector<std::size_t> attempts;
  CacheOptions o = fake_options(2, shards);
  o.backoff = [&attempts](std::size_t a) { attempts.push_back(a); };
  FanoutCache cache(dir.str(), o);

  shards[cache.shard_index("k")]->timeouts = 3;
  cache.assign("k", bytes("v"));
  CHECK(attempts == std::vector<std::size_t>{1, 2, 3});
}

TEST_CASE("statistics follow the enable flag", "[fanout][stats]") {
  TempDir dir("fanout_stats");
  CacheOptions o = disk_options(2);
  o.settings["statistics"] = "1";
  FanoutCache cache(dir.str(), o);
  CHECK(cache.settings().statistics);
  REQUIRE(cache.set("k", bytes("v")));
  cache.get("k");
  cache.get("missing");
  auto s = cache.stats(true, true);
  CHECK(s.hits == 1);
  CHECK(s.misses == 1);
  auto cleared = cache.stats(false, false);
  CHECK(cleared.hits == 0);
  CHECK(cleared.misses == 0);
}
