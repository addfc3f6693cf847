#pragma once

#include <string>

// Framing for commands run on a persistent PTY shell. Each command is
// bracketed by a BEGIN line and a DONE line carrying $?, so output and exit
// code travel on the one stream.

inline constexpr const char* FLEETRUN_BEGIN_MARKER = "__FLEETRUN_BEGIN__";
inline constexpr const char* FLEETRUN_DONE_MARKER  = "__FLEETRUN_DONE__";

struct MarkerResult {
    std::string output;
    int exit_code;
    bool found;
};

// Multi-line input (heredocs) gets the DONE echo on its own line.
std::string build_marker_command(const std::string& cmd);

// A DONE marker after the BEGIN marker, followed by a newline.
bool marker_complete(const std::string& raw);

// Output between the markers with CRLF folded and the echoed sentinel
// stripped, plus the exit code from the DONE line.
MarkerResult parse_marker_output(const std::string& raw);
