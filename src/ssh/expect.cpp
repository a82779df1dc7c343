#include "expect.hpp"
#include <core/utils.hpp>

static const char* PASSWORD_PROMPT = "password";
static const char ROOT_PROMPT = '#';

static const std::vector<std::string> SU_FAILURE_MARKERS{
    "authentication failure",
    "incorrect password",
    "su: failed",
    "su: authentication",
};

// ── ElevationScanner ─────────────────────────────────────────────────

ElevationScanner::Verdict ElevationScanner::feed(const std::string& chunk) {
    buffer_ += chunk;

    if (!password_sent_ && contains_nocase(buffer_, PASSWORD_PROMPT)) {
        return Verdict::SendPassword;
    }

    if (password_sent_ && buffer_.find(ROOT_PROMPT) != std::string::npos) {
        return Verdict::Elevated;
    }

    std::string lowered = to_lower(buffer_);
    for (const auto& marker : SU_FAILURE_MARKERS) {
        if (lowered.find(marker) != std::string::npos) {
            return Verdict::Failed;
        }
    }
    return Verdict::Continue;
}

void ElevationScanner::password_sent() {
    password_sent_ = true;
    buffer_.clear();
}

// ── CommandCompletionScanner ─────────────────────────────────────────

bool CommandCompletionScanner::feed(const std::string& chunk) {
    buffer_ += chunk;
    return buffer_.find(ROOT_PROMPT) != std::string::npos;
}

std::string CommandCompletionScanner::output() const {
    auto lines = split_lines(buffer_);
    if (lines.size() <= 2) return "";

    std::string out;
    for (size_t i = 1; i + 1 < lines.size(); ++i) {
        if (i > 1) out += "\n";
        out += lines[i];
    }
    if (!out.empty()) out += "\n";
    return out;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        std::string line = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}
