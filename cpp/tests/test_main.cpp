#include <exception>
#include <iostream>

#include "test_support.hpp"

int main() {
    using namespace psrisk_test;
    try {
        run_risk_tests();
        run_lopa_tests();
        run_standards_tests();
        run_compliance_tests();
        run_config_tests();
        run_matrix_tests();
        run_server_tests();
    } catch (const std::exception& exc) {
        std::cerr << "Unhandled exception: " << exc.what() << "\n";
        return 1;
    }

    if (failures > 0) {
        std::cerr << failures << " test(s) failed.\n";
        return 1;
    }

    std::cout << "All tests passed.\n";
    return 0;
}
