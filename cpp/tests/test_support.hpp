#ifndef PSRISK_TEST_SUPPORT_HPP
#define PSRISK_TEST_SUPPORT_HPP

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace psrisk_test {

inline int failures = 0;

inline void expect_true(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        failures += 1;
    }
}

inline void expect_near(double value, double expected, double tolerance, const std::string& message) {
    if (std::fabs(value - expected) > tolerance) {
        std::cerr << "FAIL: " << message << " (got " << value << ", expected " << expected << ")\n";
        failures += 1;
    }
}

inline void expect_equal(const std::string& value, const std::string& expected, const std::string& message) {
    if (value != expected) {
        std::cerr << "FAIL: " << message << " (got \"" << value << "\", expected \"" << expected << "\")\n";
        failures += 1;
    }
}

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// Writes content to a file under the system temp directory and returns its path.
inline std::string write_temp_file(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

// Runs fn and reports a failure unless it throws Error. Returns the message of the caught error.
template <typename Error, typename Fn>
std::string expect_throws(Fn&& fn, const std::string& message) {
    try {
        fn();
    } catch (const Error& exc) {
        return exc.what();
    }
    std::cerr << "FAIL: " << message << " (no exception thrown)\n";
    failures += 1;
    return "";
}

void run_risk_tests();
void run_lopa_tests();
void run_standards_tests();
void run_compliance_tests();
void run_config_tests();
void run_matrix_tests();
void run_server_tests();

}  // namespace psrisk_test

#endif  // PSRISK_TEST_SUPPORT_HPP
