#pragma once

#include <chrono>
#include <regex>
#include <string>
#include <vector>
#include "transport.hpp"

// Case-insensitive ECMAScript pattern. Text that does not compile as a regex
// is matched literally.
class Pattern {
public:
    Pattern(const std::string& text);

    bool found_in(const std::string& s) const { return std::regex_search(s, regex_); }
    bool search(const std::string& s, std::smatch& m) const { return std::regex_search(s, m, regex_); }

    const std::string& text() const { return text_; }
    bool literal() const { return literal_; }

private:
    std::string text_;
    std::regex regex_;
    bool literal_ = false;
};

std::string regex_escape(const std::string& s);

enum class ExpectStatus { Matched, TimedOut, StreamLost };

struct ExpectResult {
    ExpectStatus status = ExpectStatus::TimedOut;
    size_t pattern_index = 0;
    std::string before;   // output preceding the match, or everything on failure
    std::string match;
};

// Reads a stream until one of the patterns shows up. Output after the match
// stays buffered for the next call.
class ExpectMatcher {
public:
    ExpectResult expect(ChannelStream& stream, const std::vector<Pattern>& patterns,
                        std::chrono::milliseconds timeout);

    void reset() { pending_.clear(); }

private:
    bool take_match(const std::vector<Pattern>& patterns, ExpectResult& out);

    std::string pending_;
};
