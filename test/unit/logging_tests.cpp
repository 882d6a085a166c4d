// Copyright (c) 2025 The Unicity Foundation
// Unit tests for util/logging.cpp - Component loggers and --debug routing

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "util/logging.hpp"
#include <spdlog/sinks/ostream_sink.h>
#include <algorithm>
#include <sstream>

using namespace forksim::util;
using Catch::Matchers::ContainsSubstring;

namespace {

// Capture one logger's output for the lifetime of the object
class CapturedLogger {
public:
    explicit CapturedLogger(const std::string& component)
        : logger_(LogManager::GetLogger(component)),
          sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(out_)),
          old_level_(logger_->level()) {
        sink_->set_pattern("%n %l %v");
        logger_->sinks().push_back(sink_);
    }

    ~CapturedLogger() {
        auto& sinks = logger_->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
        logger_->set_level(old_level_);
    }

    std::string Text() const { return out_.str(); }

private:
    std::ostringstream out_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
    spdlog::level::level_enum old_level_;
};

} // namespace

TEST_CASE("Component loggers are distinct", "[logging]") {
    for (const char* component : {"chain", "sim", "stats", "app"}) {
        auto logger = LogManager::GetLogger(component);
        REQUIRE(logger->name() == component);
        REQUIRE(logger != LogManager::GetLogger("default"));
    }

    // Unknown names fall back to the default logger
    REQUIRE(LogManager::GetLogger("network") == LogManager::GetLogger("default"));
}

TEST_CASE("App log macros follow the app component level", "[logging]") {
    auto default_level = LogManager::GetLogger("default")->level();
    CapturedLogger app("app");

    SECTION("Silent while the component is off") {
        LogManager::SetComponentLevel("app", "off");
        LOG_APP_INFO("Simulation: {} rounds", 10);
        REQUIRE(app.Text().empty());
    }

    SECTION("Enabling app traces only the app logger") {
        LogManager::SetComponentLevel("app", "trace");
        LOG_APP_DEBUG("Colluding fork tip {} adopted at height {}", 7, 3);
        LOG_APP_TRACE("trace line");
        REQUIRE_THAT(app.Text(), ContainsSubstring("app debug Colluding fork tip 7 adopted at height 3"));
        REQUIRE_THAT(app.Text(), ContainsSubstring("app trace trace line"));
        REQUIRE(LogManager::GetLogger("default")->level() == default_level);
    }
}
