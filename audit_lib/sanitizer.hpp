#pragma once
#include <string>

// Keeps ASCII letters, digits, whitespace and ". , ! ? -"; drops everything
// else. Symbol runs are stripped before they reach the synthesizer, which may
// read them as control sequences.
std::string sanitize(const std::string &text);

// Strips leading and trailing ASCII whitespace.
std::string trim(const std::string &text);
