#pragma once
#include <string>

// Resolved once at startup; immutable for the rest of the run.
struct Instrument {
    std::string id;
    std::string description;
    double strike = 0.0;
    std::string yes_token;   // quoted
    std::string no_token;
};
