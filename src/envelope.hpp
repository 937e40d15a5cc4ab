#pragma once

#include <cstdio>
#include <string>
#include <variant>

struct Success {
    std::string text;
};

struct Failure {
    std::string error;
};

// The single outcome of a run.
using Envelope = std::variant<Success, Failure>;

// {"text":"..."} or {"error":"..."} on one line. Invalid UTF-8 is replaced
// with U+FFFD instead of failing.
std::string to_json(const Envelope& envelope);

// Writes success to out and failure to err, flushes both, and returns the
// process exit status (0 or 1).
int emit(const Envelope& envelope, std::FILE* out, std::FILE* err);
