#include "src/server/sanitizer.h"

#include <algorithm>
#include <regex>

namespace aiexec {

namespace {

const std::regex& PathPattern() {
    static const std::regex pattern(R"((^|[\s'"(=:,\[<])/[^\s'"),:\]>]+)");
    return pattern;
}

const std::regex& AssignmentPattern() {
    static const std::regex pattern(R"(\b([A-Z][A-Z0-9_]{2,})=[^\s'"]+)");
    return pattern;
}

// Single pass into a fresh string; in-place replace would be quadratic on repeated matches.
void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
    if (from.empty()) return;
    size_t pos = text.find(from);
    if (pos == std::string::npos) return;

    std::string out;
    out.reserve(text.size());
    size_t last = 0;
    while (pos != std::string::npos) {
        out.append(text, last, pos - last);
        out += to;
        last = pos + from.size();
        pos = text.find(from, last);
    }
    out.append(text, last, std::string::npos);
    text.swap(out);
}

} // namespace

void ErrorSanitizer::AddSecret(const std::string& value) {
    // Short values would mask ordinary words.
    if (value.size() < 4) return;
    AddReplacement(value, "<redacted>");
}

void ErrorSanitizer::AddReplacement(const std::string& literal, const std::string& replacement) {
    if (literal.empty()) return;
    replacements_.emplace_back(literal, replacement);
    std::stable_sort(replacements_.begin(), replacements_.end(),
                     [](const auto& a, const auto& b) { return a.first.size() > b.first.size(); });
}

std::string ErrorSanitizer::Sanitize(const std::string& text) const {
    std::string out;
    out.reserve(std::min(text.size(), kMaxLength));
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 && c != '\n' && c != '\t') continue;
        out.push_back(c);
    }

    // Literals first, on the full text, so a secret straddling the cut is still replaced.
    for (const auto& [literal, replacement] : replacements_) {
        ReplaceAll(out, literal, replacement);
    }

    // std::regex recurses per input character; it only ever sees a bounded string.
    bool truncated = out.size() > kMaxLength;
    if (truncated) {
        out.resize(kMaxLength);
    }

    out = std::regex_replace(out, PathPattern(), "$1<path>");
    out = std::regex_replace(out, AssignmentPattern(), "$1=<redacted>");

    if (out.size() > kMaxLength) {
        out.resize(kMaxLength);
        truncated = true;
    }
    if (truncated) {
        out += "...";
    }
    return out;
}

std::string ErrorSanitizer::Redact(const std::string& text) const {
    std::string out = text;
    for (const auto& [literal, replacement] : replacements_) {
        ReplaceAll(out, literal, replacement);
    }
    return out;
}

} // namespace aiexec
