#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <catch2/catch_all.hpp>

#include <json-stream/decoder.hpp>
#include <json-stream/error.hpp>

#include "util/value-recorder.hpp"

using Lines = std::vector<std::string>;

TEST_CASE("reports array values with their index path") {
  REQUIRE(decode_whole("[1,[2,3],4]") == Lines {
    "$[0] = 1",
    "$[1][0] = 2",
    "$[1][1] = 3",
    "$[2] = 4",
  });
}

TEST_CASE("reports object values with their key path") {
  auto recorder = ValueRecorder();
  auto decoder = Decoder();

  decoder.write(R"({"a":1,"b":{"c":2}})");
  decoder.end();
  REQUIRE_FALSE(decoder.read(recorder.callback()));

  auto &records = recorder.records();
  REQUIRE(records.size() == 2);
  REQUIRE(records[0].path == Path { ObjectKey { "a" } });
  REQUIRE(std::get<int64_t>(records[0].value) == 1);
  REQUIRE(records[1].path == Path { ObjectKey { "b" }, ObjectKey { "c" } });
  REQUIRE(std::get<int64_t>(records[1].value) == 2);
}

TEST_CASE("reports every kind of leaf value") {
  REQUIRE(decode_whole(R"([null, true, false, "s", -0, 42.5, {"k": null}])") == Lines {
    "$[0] = null",
    "$[1] = true",
    "$[2] = false",
    "$[3] = \"s\"",
    "$[4] = 0",
    "$[5] = 42.5",
    "$[6]['k'] = null",
  });
}

TEST_CASE("does not report containers") {
  REQUIRE(decode_whole(R"({"a": [], "b": {}, "c": [[], [{}]]})").empty());
  REQUIRE(decode_whole(R"([[], 1])") == Lines { "$[1] = 1" });
}

TEST_CASE("reports a lone top-level scalar once input ends") {
  auto recorder = ValueRecorder();
  auto decoder = Decoder();

  decoder.write("42");
  REQUIRE(decoder.read(recorder.callback()));
  REQUIRE(recorder.records().empty());

  decoder.end();
  REQUIRE_FALSE(decoder.read(recorder.callback()));
  REQUIRE(recorder.records().size() == 1);
  REQUIRE(recorder.records()[0].path.empty());
  REQUIRE(std::get<int64_t>(recorder.records()[0].value) == 42);

  REQUIRE_FALSE(decoder.read(recorder.callback()));
  REQUIRE(recorder.records().size() == 1);
}

TEST_CASE("accepts a sequence of top-level values") {
  REQUIRE(decode_whole(R"(1 "two" [3] {"four": 4})") == Lines {
    "$ = 1",
    "$ = \"two\"",
    "$[0] = 3",
    "$['four'] = 4",
  });
}

TEST_CASE("asks to be called again while input is pending") {
  auto recorder = ValueRecorder();
  auto decoder = Decoder();

  decoder.write(R"({"a": [1, 2)");
  REQUIRE(decoder.read(recorder.callback()));
  REQUIRE(recorder.records().size() == 1);

  auto path = decoder.path();
  REQUIRE(path == Path { ObjectKey { "a" }, size_t { 1 } });

  for (int i = 0; i < 3; i++) {
    REQUIRE(decoder.read(recorder.callback()));
  }
  REQUIRE(recorder.records().size() == 1);
  REQUIRE(decoder.path() == path);

  decoder.write("]}");
  REQUIRE(decoder.read(recorder.callback()));
  REQUIRE(recorder.lines() == Lines { "$['a'][0] = 1", "$['a'][1] = 2" });
  REQUIRE(decoder.at_root());
}

TEST_CASE("tracks the path of open containers") {
  auto decoder = Decoder();
  REQUIRE(decoder.at_root());

  decoder.write(R"([{"x": [)");
  REQUIRE(decoder.read(nullptr));
  REQUIRE(decoder.depth() == 3);
  REQUIRE(decoder.path() == Path { size_t { 0 }, ObjectKey { "x" }, size_t { 0 } });

  decoder.write("true], ");
  REQUIRE(decoder.read(nullptr));
  REQUIRE(decoder.path() == Path { size_t { 0 }, ObjectKey {} });

  decoder.write("\"y\"");
  REQUIRE(decoder.read(nullptr));
  REQUIRE(decoder.path() == Path { size_t { 0 }, ObjectKey { "y" } });
  REQUIRE(decoder.values_emitted() == 1);
}

TEST_CASE("fails at a closing brace where a value was expected") {
  auto decoder = Decoder();
  decoder.write(R"({"a":})");
  decoder.end();

  try {
    decoder.read(nullptr);
    FAIL("expected a DecodeError");
  } catch (const DecodeError &e) {
    REQUIRE(e.source() == "}");
    REQUIRE(e.offset() == 5);
  }

  CHECK_THROWS_AS(decoder.read(nullptr), DecodeError);
}

TEST_CASE("reports values decoded before a syntax error") {
  auto recorder = ValueRecorder();
  auto decoder = Decoder();
  decoder.write("[1, 2 3]");

  CHECK_THROWS_AS(decoder.read(recorder.callback()), DecodeError);
  REQUIRE(recorder.lines() == Lines { "$[0] = 1", "$[1] = 2" });
}

TEST_CASE("rejects malformed documents") {
  auto malformed = GENERATE(as<std::string> {},
    "[1,]",
    "[,1]",
    R"({"a":1,})",
    R"({"a" 1})",
    R"({"a":1 "b":2})",
    R"({1: 2})",
    R"({null: 2})",
    R"({"a":1,[2]})",
    "[1}",
    R"({"a":1])",
    "]",
    ":",
    "[1 2]",
    "[tru]",
    "[007]",
    R"(["\q"])"
  );

  auto decoder = Decoder();
  decoder.write(malformed);
  decoder.end();

  INFO(malformed);
  CHECK_THROWS_AS(decoder.read(nullptr), DecodeError);
}

TEST_CASE("rejects writes after end without touching decoded state") {
  auto recorder = ValueRecorder();
  auto decoder = Decoder();

  decoder.write("[1,");
  REQUIRE(decoder.read(recorder.callback()));
  decoder.end();

  CHECK_THROWS_AS(decoder.write("2]"), StreamError);
  REQUIRE(decoder.path() == Path { size_t { 1 } });

  REQUIRE_FALSE(decoder.read(recorder.callback()));
  REQUIRE(recorder.lines() == Lines { "$[0] = 1" });
}

TEST_CASE("leaves the path open when input ends inside a container") {
  auto decoder = Decoder();
  decoder.write(R"({"a": [1, 2)");
  decoder.end();

  REQUIRE_FALSE(decoder.read(nullptr));
  REQUIRE_FALSE(decoder.at_root());
  REQUIRE(decoder.depth() == 2);
  REQUIRE(decoder.values_emitted() == 2);
}

TEST_CASE("stays exhausted once input has ended") {
  auto decoder = Decoder();
  decoder.write("true");
  decoder.end();

  REQUIRE_FALSE(decoder.read(nullptr));
  REQUIRE_FALSE(decoder.read(nullptr));
  CHECK_THROWS_AS(decoder.write("false"), StreamError);
  REQUIRE(decoder.values_emitted() == 1);
}

TEST_CASE("becomes unusable when the callback throws") {
  auto decoder = Decoder();
  decoder.write("[1, 2, 3]");
  decoder.end();

  auto calls = 0;
  auto throwing = [&](const Path &, const Value &) {
    calls++;
    if (calls == 2) throw std::runtime_error("callback failed");
  };

  CHECK_THROWS_AS(decoder.read(throwing), std::runtime_error);
  REQUIRE(calls == 2);
  CHECK_THROWS_AS(decoder.read(throwing), DecodeError);
  REQUIRE(calls == 2);
}
