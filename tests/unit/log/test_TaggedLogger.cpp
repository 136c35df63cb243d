#ifdef SM_LOG_DEBUG
#include <doctest/doctest.h>
#include "utils/TaggedLogger.hpp"

#include <functional>
#include <iostream>
#include <sstream>
#include <string>

namespace {

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("Disabled logger drops messages") {
    auto output = captureStderr([] {
        SM::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "TestTag");
        logger.flush();
    });
    CHECK(output.empty());
}

TEST_CASE("Enabled logger writes tags, thread and message") {
    auto output = captureStderr([] {
        SM::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setThreadName("Driver");
        logger.log_impl("hello log", std::source_location::current(), "AnimationEngine", "INFO");
        logger.flush();
    });
    CHECK(output.find("[AnimationEngine][INFO]") != std::string::npos);
    CHECK(output.find("[Driver]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
    CHECK(output.find("log/test_TaggedLogger.cpp:") != std::string::npos);
}

TEST_CASE("Flush waits for every queued message") {
    auto output = captureStderr([] {
        SM::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        for (int i = 0; i < 50; ++i) {
            logger.log_impl("tick " + std::to_string(i), std::source_location::current(), "Engine");
        }
        logger.flush();
    });
    CHECK(output.find("tick 0\n") != std::string::npos);
    CHECK(output.find("tick 49\n") != std::string::npos);
    CHECK(output.find("tick 0\n") < output.find("tick 49\n"));
}

TEST_CASE("Skip tags filter messages") {
    SUBCASE("tween traffic is skipped by default") {
        auto output = captureStderr([] {
            SM::TaggedLogger logger;
            logger.setLoggingEnabled(true);
            logger.log_impl("Start tween on timeline track", std::source_location::current(), "Tween");
            logger.flush();
        });
        CHECK(output.empty());
    }
    SUBCASE("replacing the skip list lets it through") {
        auto output = captureStderr([] {
            SM::TaggedLogger logger;
            logger.setLoggingEnabled(true);
            logger.setSkipTags({"StyleSheet"});
            logger.log_impl("Start tween on timeline track", std::source_location::current(), "Tween");
            logger.log_impl("Unknown ease", std::source_location::current(), "StyleSheet", "WARNING");
            logger.flush();
        });
        CHECK(output.find("Start tween on timeline track") != std::string::npos);
        CHECK(output.find("Unknown ease") == std::string::npos);
    }
}

TEST_CASE("Tag lists split on commas") {
    CHECK(SM::parse_tag_list("Tween") == std::set<std::string>{"Tween"});
    CHECK(SM::parse_tag_list(" Tween , StyleSheet,,") == std::set<std::string>{"Tween", "StyleSheet"});
    CHECK(SM::parse_tag_list("").empty());
    CHECK(SM::parse_tag_list(" , ").empty());
}

} // TEST_SUITE
#endif // SM_LOG_DEBUG
