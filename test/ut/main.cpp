//=============================================================================
// gemtab Unit Tests - Main Entry Point
//=============================================================================

#include <boost/ut.hpp>

int main() {
    // Suites register themselves through static initialization and run
    // when the runner is destroyed
}
