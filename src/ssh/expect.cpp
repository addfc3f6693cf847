#include "expect.hpp"
#include <core/log.hpp>
#include <algorithm>
#include <cstring>

namespace {

constexpr auto REGEX_FLAGS = std::regex::ECMAScript | std::regex::icase;
constexpr long long READ_SLICE_MS = 50;

} // namespace

std::string regex_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() * 2);
    for (char c : s) {
        if (c != '\0' && std::strchr("\\^$.|?*+()[]{}/", c)) out += '\\';
        out += c;
    }
    return out;
}

Pattern::Pattern(const std::string& text) : text_(text) {
    try {
        regex_ = std::regex(text, REGEX_FLAGS);
    } catch (const std::regex_error& e) {
        fleetrun_log(fmt::format("Pattern '{}' does not compile ({}), using it literally", text, e.what()));
        regex_ = std::regex(regex_escape(text), REGEX_FLAGS);
        literal_ = true;
    }
}

bool ExpectMatcher::take_match(const std::vector<Pattern>& patterns, ExpectResult& out) {
    for (size_t i = 0; i < patterns.size(); ++i) {
        std::smatch m;
        if (!patterns[i].search(pending_, m)) continue;
        out.status = ExpectStatus::Matched;
        out.pattern_index = i;
        out.before = m.prefix().str();
        out.match = m.str(0);
        pending_ = m.suffix().str();
        return true;
    }
    return false;
}

ExpectResult ExpectMatcher::expect(ChannelStream& stream, const std::vector<Pattern>& patterns,
                                   std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    auto deadline = Clock::now() + timeout;
    ExpectResult result;

    for (;;) {
        if (take_match(patterns, result)) return result;

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (left <= 0) {
            result.status = ExpectStatus::TimedOut;
            break;
        }
        if (stream.read(pending_, static_cast<int>(std::min<long long>(left, READ_SLICE_MS))) < 0) {
            // The last chunk before close may still hold the prompt.
            if (take_match(patterns, result)) return result;
            result.status = ExpectStatus::StreamLost;
            break;
        }
    }

    result.before = std::move(pending_);
    pending_.clear();
    return result;
}
