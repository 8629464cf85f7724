#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace {

using namespace scout::observability;

void TestPlainFields() {
  assert(FormatLogLine("probe finished", {}) == "probe finished");
  assert(FormatLogLine("probe finished", {StringField("probe", "mdns"), IntField("results", 3), BoolField("timed_out", false)}) ==
         "probe finished probe=mdns results=3 timed_out=false");
  assert(FormatLogLine("scored", {DoubleField("score", 0.7), DurationField("elapsed", std::chrono::milliseconds(1500))}) ==
         "scored score=0.700 elapsed=1500ms");
}

void TestValuesAreQuotedWhenNeeded() {
  assert(FormatLogLine("device", {StringField("manufacturer", "Philips Lighting")}) == R"(device manufacturer="Philips Lighting")");
  assert(FormatLogLine("device", {StringField("hostname", "")}) == R"(device hostname="")");
  assert(FormatLogLine("txt", {StringField("record", "md=Hue Bridge")}) == R"(txt record="md=Hue Bridge")");
  assert(FormatLogLine("http", {StringField("server", R"(say "hi" \o)")}) == R"(http server="say \"hi\" \\o")");
  assert(FormatLogLine("http", {StringField("body", "a\nb")}) == R"(http body="a\nb")");
}

void TestLevelNames() {
  assert(ParseLogLevel("debug") == spdlog::level::debug);
  assert(ParseLogLevel("warning") == spdlog::level::warn);
  assert(ParseLogLevel("off") == spdlog::level::off);

  bool threw = false;
  try {
    ParseLogLevel("verbose");
  } catch (const scout::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestFileSinkHonoursLevel() {
  unsetenv("SCOUT_LOG_LEVEL");
  unsetenv("SCOUT_LOG_PATTERN");
  unsetenv("SCOUT_LOG_FILE");

  const auto path = std::filesystem::temp_directory_path() / "device_scout_logging_test.log";
  std::filesystem::remove(path);

  scout::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("info");
  config.mutable_logging()->set_pattern("%l %v");
  config.mutable_logging()->set_file(path.string());

  InitializeLogging(config);
  SCOUT_LOG_DEBUG("hidden", {StringField("probe", "upnp")});
  SCOUT_LOG_INFO("device", {StringField("address", "192.168.1.20"), StringField("manufacturer", "Signify Netherlands B.V.")});
  ShutdownLogging();

  std::ifstream      in(path);
  std::ostringstream text;
  text << in.rdbuf();
  assert(text.str() == "info device address=192.168.1.20 manufacturer=\"Signify Netherlands B.V.\"\n");

  // Logging after shutdown is a no-op.
  SCOUT_LOG_INFO("after shutdown");
  std::filesystem::remove(path);
}

} // namespace

int main() {
  TestPlainFields();
  TestValuesAreQuotedWhenNeeded();
  TestLevelNames();
  TestFileSinkHonoursLevel();

  std::cout << "device_scout_unit_logging: pass\n";
  return 0;
}
