#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
#ifndef HC_LOG_DISABLED
        std::lock_guard<std::mutex> lock(HC::TaggedLogger::coutMutex);
#endif
        std::cout << "Test: " << in.m_name << std::endl;
    }
    void report_query(const doctest::QueryData&) override {
    }
    void test_run_start() override {
    }
    void test_run_end(const doctest::TestRunStats&) override {
    }
    void test_case_reenter(const doctest::TestCaseData&) override {
    }
    void test_case_end(const doctest::CurrentTestCaseStats&) override {
    }
    void test_case_exception(const doctest::TestCaseException&) override {
    }
    void subcase_start(const doctest::SubcaseSignature& in) override {
#ifndef HC_LOG_DISABLED
        std::lock_guard<std::mutex> lock(HC::TaggedLogger::coutMutex);
#endif
        std::cout << "\tSubcase: " << in.m_name << std::endl;
    }
    void subcase_end() override {
    }
    void log_assert(const doctest::AssertData&) override {
    }
    void log_message(const doctest::MessageData&) override {
    }
    void test_case_skipped(const doctest::TestCaseData&) override {
    }
};

REGISTER_LISTENER("test_start", 1, ShowTestStart);

int main(int argc, char** argv) {
#ifndef HC_LOG_DISABLED
    // Quiet unless HOMECONTROL_LOG asks otherwise
    HC::set_logging_enabled(false);
#endif

    doctest::Context context;
    context.applyCommandLine(argc, argv);

#ifndef HC_LOG_DISABLED
    HC::set_thread_name("TestMain");
    bool enableLog = false;
    if (const char* _env_log = std::getenv("HOMECONTROL_LOG")) {
        if (std::strcmp(_env_log, "0") != 0) enableLog = true;
    }
#endif

    if (context.shouldExit()) {
        return context.run();
    }

#ifndef HC_LOG_DISABLED
    if (enableLog) {
        HC::set_logging_enabled(true);
        hc_log("Starting test execution", "TEST", "INFO");
    }
#endif

    int res = context.run();

#ifndef HC_LOG_DISABLED
    if (enableLog) {
        if (res == 0) {
            hc_log("All tests passed successfully", "TEST", "INFO");
        } else {
            hc_log("Some tests failed", "TEST", "ERROR");
        }
    }
#endif

    return res;
}
