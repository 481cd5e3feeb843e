#pragma once

#include <string>
#include <utility>
#include <vector>

namespace aiexec {

// Scrubs text produced by or about untrusted code before it reaches a client: known
// secrets and scratch paths are replaced literally, then any remaining absolute path and
// NAME=value environment assignment is masked.
class ErrorSanitizer {
public:
    static constexpr size_t kMaxLength = 2048;

    void AddSecret(const std::string& value);
    void AddReplacement(const std::string& literal, const std::string& replacement);

    std::string Sanitize(const std::string& text) const;

    // Literal replacements only, for captured program output that may legitimately
    // contain paths of its own.
    std::string Redact(const std::string& text) const;

private:
    std::vector<std::pair<std::string, std::string>> replacements_;
};

} // namespace aiexec
