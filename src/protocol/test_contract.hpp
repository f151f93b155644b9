#pragma once

#include <string>
#include <vector>

namespace protoforge::protocol {

enum class TestStatus {
    Passed,
    Failed,
    TimedOut,
    ExecutionError
};

struct TestCaseResult {
    std::string name;
    bool passed = false;
    std::string output;
};

struct TestResult {
    TestStatus status = TestStatus::Failed;
    int exit_code = -1;
    std::vector<TestCaseResult> cases;
    std::string output;  // stdout followed by stderr
    double duration_ms = 0.0;

    bool all_passed() const { return status == TestStatus::Passed; }
};

inline std::string to_string(const TestStatus status) {
    switch (status) {
        case TestStatus::Passed:
            return "passed";
        case TestStatus::Failed:
            return "failed";
        case TestStatus::TimedOut:
            return "timed-out";
        case TestStatus::ExecutionError:
            return "execution-error";
        default:
            return "unknown";
    }
}

}  // namespace protoforge::protocol
