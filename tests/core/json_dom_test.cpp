#include "core/json_dom.hpp"

#include <catch2/catch.hpp>

#include <string>

using scenkit::core::json::FindField;
using scenkit::core::json::FindStringField;
using scenkit::core::json::MakeArray;
using scenkit::core::json::MakeBool;
using scenkit::core::json::MakeNumber;
using scenkit::core::json::MakeObject;
using scenkit::core::json::MakeString;
using scenkit::core::json::Parse;
using scenkit::core::json::Serialize;
using scenkit::core::json::Value;

TEST_CASE("Parser reads nested profile-like documents", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(Parse(R"({"interpreter": {"strategy": "fixed", "path": "/usr/bin/python3"},
                    "folders": {"output": "io"}, "flags": [1, true, null]})",
                root, error));

  const Value* interpreter = FindField(root, "interpreter");
  REQUIRE(interpreter != nullptr);
  REQUIRE(FindStringField(*interpreter, "strategy") == "fixed");
  REQUIRE(FindStringField(*interpreter, "path") == "/usr/bin/python3");
  REQUIRE(FindField(root, "flags")->array_value.size() == 3U);
  REQUIRE_FALSE(FindStringField(root, "missing").has_value());
}

TEST_CASE("Parser decodes unicode escapes to UTF-8", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(Parse(R"({"name": "caf\u00e9 \u20ac"})", root, error));
  REQUIRE(FindStringField(root, "name") == std::string("caf\xc3\xa9 \xe2\x82\xac"));
}

TEST_CASE("Parser reports line and column on malformed input", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE_FALSE(Parse("{\n  \"a\": 1,\n  \"b\" 2\n}", root, error));
  REQUIRE(error.find("line 3") != std::string::npos);
}

TEST_CASE("Serialize emits sorted keys and integral numbers", "[core][json]") {
  Value root = MakeObject();
  root.object_value["z"] = MakeNumber(7);
  root.object_value["a"] = MakeString("say \"hi\"\n");
  Value list = MakeArray();
  list.array_value.push_back(MakeBool(false));
  list.array_value.push_back(MakeNumber(1.5));
  root.object_value["m"] = std::move(list);

  REQUIRE(Serialize(root) == R"({"a":"say \"hi\"\n","m":[false,1.5],"z":7})");

  Value reparsed;
  std::string error;
  REQUIRE(Parse(Serialize(root, 2), reparsed, error));
  REQUIRE(FindStringField(reparsed, "a") == "say \"hi\"\n");
}
