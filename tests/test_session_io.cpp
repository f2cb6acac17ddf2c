#include <catch2/catch.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <algorithm>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "term_reel/errors.hpp"
#include "term_reel/logging.hpp"
#include "term_reel/memory_io.hpp"
#include "term_reel/session.hpp"
#include "term_reel/session_io.hpp"

#include "test_helpers.hpp"

using namespace term_reel;
using json = nlohmann::json;

namespace {

json minimal_document() {
  return json{{"formatVersion", "1.0"},
              {"startTime", 1000},
              {"frames", json::array({{{"timestamp", 0},
                                       {"content", "$ "},
                                       {"type", "output"}}})},
              {"terminalInfo", json::object()}};
}

std::string malformed_field(const json &document) {
  try {
    load_session(document.dump());
  } catch (const MalformedDocument &e) {
    return e.field();
  }
  return "<loaded>";
}

} // namespace

TEST_CASE("save then load reproduces the session", "[session_io]") {
  const Session original = testing::sample_session();
  Session loaded = load_session(save_session(original));
  REQUIRE(loaded == original);

  SECTION("optional fields may be absent") {
    Session bare;
    bare.start_time = 42;
    bare.frames = {make_input(0, "\x01\x7f\xc3\xa9"), make_output(0, "")};
    REQUIRE(load_session(save_session(bare)) == bare);
  }
}

TEST_CASE("saved documents use the documented layout", "[session_io]") {
  json document = json::parse(save_session(testing::sample_session()));

  REQUIRE(document["formatVersion"] == "1.0");
  REQUIRE(document["startTime"] == 1700000000000);
  REQUIRE(document["endTime"] == 1700000009000);
  REQUIRE(document["frames"][1]["type"] == "input");
  REQUIRE(document["frames"][1]["content"] == "l");
  REQUIRE(document["terminalInfo"]["shellPath"] == "/bin/bash");
  REQUIRE(document["dimensions"]["width"] == 100);
}

TEST_CASE("a newer major version is rejected", "[session_io]") {
  json document = minimal_document();
  document["formatVersion"] = "2.0";
  REQUIRE_THROWS_AS(load_session(document.dump()), IncompatibleFormat);

  SECTION("the version is checked before the structure") {
    json broken = json{{"formatVersion", "2.0"}};
    REQUIRE_THROWS_AS(load_session(broken.dump()), IncompatibleFormat);
  }

  SECTION("minor versions are accepted") {
    document["formatVersion"] = "1.7";
    REQUIRE(load_session(document.dump()).format_version == "1.7");
  }
}

TEST_CASE("the legacy version key is accepted", "[session_io]") {
  json document = minimal_document();
  document.erase("formatVersion");
  document["version"] = "1.0";
  REQUIRE(load_session(document.dump()).frames.size() == 1);
}

TEST_CASE("malformed documents name the offending field", "[session_io]") {
  REQUIRE_THROWS_AS(load_session("{not json"), MalformedDocument);
  REQUIRE_THROWS_AS(load_session("[]"), MalformedDocument);

  json document = minimal_document();

  SECTION("missing version") {
    document.erase("formatVersion");
    REQUIRE(malformed_field(document) == "formatVersion");
  }
  SECTION("missing start time") {
    document.erase("startTime");
    REQUIRE(malformed_field(document) == "startTime");
  }
  SECTION("frames is not an array") {
    document["frames"] = "nope";
    REQUIRE(malformed_field(document) == "frames");
  }
  SECTION("unknown frame type") {
    document["frames"][0]["type"] = "correction";
    REQUIRE(malformed_field(document) == "frames[0].type");
  }
  SECTION("negative timestamp") {
    document["frames"][0]["timestamp"] = -5;
    REQUIRE(malformed_field(document) == "frames[0].timestamp");
  }
  SECTION("start time beyond the millisecond range") {
    document["startTime"] = std::numeric_limits<uint64_t>::max();
    REQUIRE(malformed_field(document) == "startTime");
    document["startTime"] = 1e300;
    REQUIRE(malformed_field(document) == "startTime");
  }
  SECTION("huge fractional timestamp") {
    document["frames"][0]["timestamp"] = 1e300;
    REQUIRE(malformed_field(document) == "frames[0].timestamp");
    document["frames"][0]["timestamp"] = -1e300;
    REQUIRE(malformed_field(document) == "frames[0].timestamp");
  }
  SECTION("content is not a string") {
    document["frames"][0]["content"] = 7;
    REQUIRE(malformed_field(document) == "frames[0].content");
  }
  SECTION("missing terminal info") {
    document.erase("terminalInfo");
    REQUIRE(malformed_field(document) == "terminalInfo");
  }
}

TEST_CASE("loading is lenient where the format allows it", "[session_io]") {
  json document = minimal_document();

  SECTION("fractional timestamps are rounded") {
    document["frames"][0]["timestamp"] = 12.6;
    REQUIRE(load_session(document.dump()).frames[0].timestamp == 13);
  }
  SECTION("a null end time is absent") {
    document["endTime"] = nullptr;
    REQUIRE_FALSE(load_session(document.dump()).end_time.has_value());
  }
  SECTION("out-of-range dimensions fall back") {
    document["dimensions"] = json{{"width", 3}, {"height", 40}};
    REQUIRE(load_session(document.dump()).dimensions == Dimensions{80, 40});
  }
  SECTION("unknown keys are ignored") {
    document["exportInfo"] = json{{"exportedBy", "someone"}};
    REQUIRE_NOTHROW(load_session(document.dump()));
  }
}

TEST_CASE("nlohmann conversions follow the same rules", "[session_io]") {
  const Session original = testing::sample_session();
  json j = original;
  REQUIRE(j.get<Session>() == original);

  j["formatVersion"] = "2.0";
  REQUIRE_THROWS_AS(j.get<Session>(), IncompatibleFormat);
}

TEST_CASE("export adds export metadata", "[session_io]") {
  const Session original = testing::sample_session();
  std::chrono::system_clock::time_point at{std::chrono::milliseconds(1500)};

  std::string text = export_session(original, at);
  json document = json::parse(text);

  REQUIRE(document["exportInfo"]["exportedAt"] == "1970-01-01T00:00:01.500Z");
  REQUIRE(document["exportInfo"]["exportedBy"] == "term_reel");
  REQUIRE(document["exportInfo"]["version"] == "1.0");
  REQUIRE(load_session(text) == original);
}

TEST_CASE("raw captures keep their correction events", "[session_io]") {
  json document = minimal_document();
  document["frames"] = json::array({
      {{"timestamp", 0}, {"content", "a"}, {"type", "input"}},
      {{"timestamp", 5}, {"content", "[BACKSPACE]"}, {"type", "input"}},
      {{"timestamp", 9}, {"content", ""}, {"type", "correction"}},
      {{"timestamp", 12}, {"content", "ok"}, {"type", "output"}},
  });

  RawCapture capture = load_raw_capture(document.dump());
  REQUIRE(capture.start_time == 1000);
  REQUIRE(capture.events.size() == 4);
  REQUIRE(std::holds_alternative<Keystroke>(capture.events[0]));
  REQUIRE(std::holds_alternative<Deletion>(capture.events[1]));
  REQUIRE(std::holds_alternative<Deletion>(capture.events[2]));
  REQUIRE(std::holds_alternative<Flush>(capture.events[3]));

  RawCapture again = load_raw_capture(save_raw_capture(capture));
  REQUIRE(to_raw_frames(again.events) == to_raw_frames(capture.events));
}

TEST_CASE("recordings survive a trip through the filesystem",
          "[session_io]") {
  testing::TempDir dir;
  const Session original = testing::sample_session();
  std::string path = dir.file("demo.pcr");

  REQUIRE(save_session_file(path, original));
  REQUIRE(load_session_file(path) == original);

  SECTION("saving replaces an existing file") {
    Session edited = original;
    edited.frames.pop_back();
    REQUIRE(save_session_file(path, edited));
    REQUIRE(load_session_file(path) == edited);
  }

  SECTION("a missing file is a malformed document") {
    REQUIRE_THROWS_AS(load_session_file(dir.file("missing.pcr")),
                      MalformedDocument);
  }

  SECTION("an unwritable destination reports failure") {
    REQUIRE_FALSE(save_session_file(dir.file("no/such/dir/x.pcr"), original));
  }
}

TEST_CASE("mapped recordings move and release cleanly", "[session_io]") {
  testing::TempDir dir;
  std::string path = dir.write("doc.pcr", "{\"a\": 1}");

  MappedFile file;
  REQUIRE(MemoryLoader::load_file(path, file));
  REQUIRE(file.view() == "{\"a\": 1}");

  MappedFile moved(std::move(file));
  REQUIRE_FALSE(file.is_valid());
  REQUIRE(moved.size() == 8);

  MappedFile assigned;
  assigned = std::move(moved);
  REQUIRE_FALSE(moved.is_valid());
  REQUIRE(assigned.view() == "{\"a\": 1}");

  SECTION("empty and missing files do not load") {
    MappedFile other;
    REQUIRE_FALSE(MemoryLoader::load_file(dir.write("empty.pcr", ""), other));
    REQUIRE_FALSE(MemoryLoader::load_file(dir.file("absent.pcr"), other));
    REQUIRE_FALSE(other.is_valid());
  }

  SECTION("a failed write leaves the old recording in place") {
    REQUIRE_FALSE(MemoryLoader::write_file(dir.file("no/dir/doc.pcr"), "x"));
    REQUIRE(MemoryLoader::write_file(path, "[]"));
    MappedFile reread;
    REQUIRE(MemoryLoader::load_file(path, reread));
    REQUIRE(reread.view() == "[]");
  }
}

TEST_CASE("file round trips record their phases", "[session_io]") {
  testing::TempDir dir;
  std::string path = dir.file("timed.pcr");

  TimingCollector::clear();
  REQUIRE(save_session_file(path, testing::sample_session()));
  REQUIRE(load_session_file(path).frames.size() == 6);

  std::vector<TimingEntry> entries = TimingCollector::snapshot();
  auto recorded = [&entries](const std::string &phase) {
    return std::any_of(entries.begin(), entries.end(),
                       [&phase](const TimingEntry &e) {
                         return e.name == phase && e.microseconds >= 0;
                       });
  };
  if (ENABLE_TIMING) {
    REQUIRE(recorded("save_session"));
    REQUIRE(recorded("write_file"));
    REQUIRE(recorded("load_file"));
    REQUIRE(recorded("load_session"));
  } else {
    REQUIRE(entries.empty());
  }
  TimingCollector::clear();
  REQUIRE(TimingCollector::snapshot().empty());
}
