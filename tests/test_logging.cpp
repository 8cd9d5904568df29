#include <algorithm>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <catch2/catch.hpp>
#include <spdlog/sinks/ostream_sink.h>

#include "logging_test_fixture.hpp"
#include "kit_operator/logging.hpp"

using namespace kit_operator;

namespace {

/** @brief Log one line through the JSON file formatter and return it. */
std::string format_json_line(const std::string& logger_name, const std::string& message) {
    std::ostringstream stream;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
    sink->set_formatter(make_json_line_formatter());
    spdlog::logger logger{logger_name, sink};
    logger.info("{}", message);
    logger.flush();
    return stream.str();
}

}  // namespace

TEST_CASE("JSON log lines escape quotes, backslashes and control characters") {
    const std::string line = format_json_line(
        "auto-scaling-group/default/\"asg\"#1",
        "creating autoscaling group asg, ValidationError: \"C:\\tmp\" is\tnot\na subnet"
    );

    REQUIRE(line.find(R"("logger":"auto-scaling-group/default/\"asg\"#1")") != std::string::npos);
    REQUIRE(line.find(R"("msg":"creating autoscaling group asg, ValidationError: \"C:\\tmp\" is\tnot\na subnet"})") != std::string::npos);
    REQUIRE(std::count(line.begin(), line.end(), '\n') == 1);
    REQUIRE(line.back() == '\n');
}

TEST_CASE("JSON log lines encode other control characters as unicode escapes") {
    const std::string line = format_json_line("kit_operator", std::string{"bell\x07"});
    REQUIRE(line.find(R"("msg":"bell\u0007")") != std::string::npos);
}

TEST_CASE("make_scoped_logger names the clone and shares the sinks") {
    const auto base = test::ensure_logger_initialized();
    const auto scoped = make_scoped_logger(base, "auto-scaling-group/default/asg-a#1");
    REQUIRE(scoped->name() == "auto-scaling-group/default/asg-a#1");
    REQUIRE(scoped->sinks().size() == base->sinks().size());
    REQUIRE(scoped->level() == base->level());
    REQUIRE_THROWS_AS(make_scoped_logger(nullptr, "scope"), std::invalid_argument);
}
