#include "progress_parser.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>

namespace driveup {

namespace {

const std::regex& percent_regex() {
    static const std::regex re(R"((\d+)%)");
    return re;
}

// Both the legacy "MBytes/s" and the current "MiB/s" spellings
const std::regex& speed_regex() {
    static const std::regex re(R"((\d+(?:\.\d+)?\s*(?:[kKMGTP]i?)?(?:B|Bytes|bytes)/s))");
    return re;
}

// "ETA -" (unknown) never matches
const std::regex& eta_regex() {
    static const std::regex re(R"(ETA\s+([\w:]+))");
    return re;
}

std::string trim(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

} // namespace

ProgressSignals parse_progress_line(std::string_view line) {
    ProgressSignals signals;
    std::string text(line);
    std::smatch m;

    if (std::regex_search(text, m, percent_regex())) {
        auto digits = m.str(1);
        int value = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec == std::errc() && ptr == digits.data() + digits.size()) {
            signals.percent = std::min(value, 100);
        }
    }

    if (std::regex_search(text, m, speed_regex())) {
        signals.speed = trim(m.str(1));
    }

    if (std::regex_search(text, m, eta_regex())) {
        signals.eta = trim(m.str(1));
    }

    return signals;
}

bool ProgressState::merge(const ProgressSignals& signals) {
    if (signals.percent) percent = *signals.percent;
    if (signals.speed) speed = *signals.speed;
    if (signals.eta) eta = *signals.eta;
    return !signals.empty();
}

} // namespace driveup
