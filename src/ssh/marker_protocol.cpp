#include "marker_protocol.hpp"
#include <core/utils.hpp>
#include <cstring>

namespace {

// Quoting splits the words so the PTY echo of the command line never
// contains a full marker; only the echo output does.
constexpr const char* BEGIN_ECHO = "echo __FLEETRUN_BEG''IN__";
constexpr const char* DONE_ECHO  = "echo __FLEETRUN_DO''NE__ $?";
constexpr const char* DONE_STEM  = "__FLEETRUN_DO";

struct Frame {
    size_t body = 0;                    // first byte after BEGIN (or 0)
    size_t done = std::string::npos;    // start of DONE marker
};

Frame locate(const std::string& raw) {
    Frame f;
    size_t begin = raw.find(FLEETRUN_BEGIN_MARKER);
    if (begin != std::string::npos) f.body = begin + std::strlen(FLEETRUN_BEGIN_MARKER);
    f.done = raw.find(FLEETRUN_DONE_MARKER, f.body);
    return f;
}

int exit_code_after(const std::string& raw, size_t done) {
    size_t digits = raw.find_first_of("0123456789", done + std::strlen(FLEETRUN_DONE_MARKER));
    if (digits == std::string::npos) return 0;
    size_t eol = raw.find_first_of("\r\n", digits);
    return safe_stoi(raw.substr(digits, eol == std::string::npos ? std::string::npos : eol - digits), 0);
}

void strip_crlf(std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') continue;
        out += s[i];
    }
    s.swap(out);
}

void rstrip(std::string& s) {
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

} // namespace

std::string build_marker_command(const std::string& cmd) {
    const char* sep = cmd.find('\n') == std::string::npos ? "; " : "\n";
    return std::string(BEGIN_ECHO) + "; " + cmd + sep + DONE_ECHO + "\n";
}

bool marker_complete(const std::string& raw) {
    Frame f = locate(raw);
    return f.done != std::string::npos && raw.find('\n', f.done) != std::string::npos;
}

MarkerResult parse_marker_output(const std::string& raw) {
    Frame f = locate(raw);
    if (f.done == std::string::npos) return {"", 0, false};

    size_t start = f.body;
    if (start > 0) {
        if (start < f.done && raw[start] == '\r') start++;
        if (start < f.done && raw[start] == '\n') start++;
    }
    std::string body = raw.substr(start, f.done - start);
    strip_crlf(body);
    rstrip(body);

    // The shell may echo the DONE command line as the last line of output.
    size_t last_line = body.rfind('\n');
    size_t tail = last_line == std::string::npos ? 0 : last_line;
    if (body.find(DONE_STEM, tail) != std::string::npos) {
        body.erase(tail);
        rstrip(body);
    }

    return {body, exit_code_after(raw, f.done), true};
}
