//=============================================================================
// Slate Unit Tests - Main Entry Point
//=============================================================================

#include <boost/ut.hpp>

int main() {
    // Suites register themselves during static initialization;
    // boost.ut runs them when the runner is destroyed
}
