//=============================================================================
// rivvon Unit Tests - Main Entry Point
//=============================================================================

#include <boost/ut.hpp>

int main() {
    // Suites register themselves through static initialization
}
