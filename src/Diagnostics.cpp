#include "Diagnostics.h"

std::string describe(const SymbolNotAccepted& error) {
    return "TM doesn't accept symbol: " + error.value;
}
