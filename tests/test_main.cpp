#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "utils/TaggedLogger.hpp"

#include <iostream>
#include <mutex>

// Prints each test case and subcase as it starts so a hung tick loop is easy to place.
struct TestProgressListener : public doctest::IReporter {
    explicit TestProgressListener(const doctest::ContextOptions&) {}

    void test_case_start(const doctest::TestCaseData& in) override { print("Test: ", in.m_name); }
    void subcase_start(const doctest::SubcaseSignature& in) override { print("\tSubcase: ", in.m_name); }

    void report_query(const doctest::QueryData&) override {}
    void test_run_start() override {}
    void test_run_end(const doctest::TestRunStats&) override {}
    void test_case_reenter(const doctest::TestCaseData&) override {}
    void test_case_end(const doctest::CurrentTestCaseStats&) override {}
    void test_case_exception(const doctest::TestCaseException&) override {}
    void subcase_end() override {}
    void log_assert(const doctest::AssertData&) override {}
    void log_message(const doctest::MessageData&) override {}
    void test_case_skipped(const doctest::TestCaseData&) override {}

private:
    template <typename Name>
    static void print(const char* prefix, const Name& name) {
#ifdef SM_LOG_DEBUG
        // Shares stdout/stderr ordering with the logger's writer thread.
        std::lock_guard<std::mutex> lock(SM::TaggedLogger::coutMutex);
#endif
        std::cout << prefix << name << std::endl;
    }
};

REGISTER_LISTENER("test_progress", 1, TestProgressListener);

int main(int argc, char** argv) {
    doctest::Context context;
    context.applyCommandLine(argc, argv);

    // --list-test-cases and friends (used by test discovery) never log.
    if (context.shouldExit()) {
        return context.run();
    }

#ifdef SM_LOG_DEBUG
    SM::set_thread_name("TestMain");
    bool const logging = SM::configure_logging_from_env();
    if (logging) {
        sm_log("Starting test execution", "TEST", "INFO");
    }
#endif

    int const result = context.run();

#ifdef SM_LOG_DEBUG
    if (logging) {
        sm_log(result == 0 ? "All tests passed" : "Some tests failed", "TEST", result == 0 ? "SUCCESS" : "FAILURE");
        SM::logger().flush();
    }
#endif

    return result;
}
