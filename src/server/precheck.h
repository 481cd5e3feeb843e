#pragma once

#include <string>
#include <vector>

namespace aiexec {

// A pre-check finding. Line and column are 1-based; 0 means "whole submission".
struct Diagnostic {
    int line = 0;
    int column = 0;
    std::string message;
};

bool IsIdentifier(const std::string& name);

// Structural scans that need no toolchain: balanced brackets, terminated string
// literals and comments, indentation (Python), include hygiene (C++), and a top-level
// definition of the entry point. They stop at the first structural error.
std::vector<Diagnostic> ScanPythonSource(const std::string& source, const std::string& entry_point);
std::vector<Diagnostic> ScanCppSource(const std::string& source, const std::string& entry_point);

// Collects "<label>:<line>:<col>: error: <message>" lines from compiler-style output.
// Lines for other files, notes and warnings are skipped.
std::vector<Diagnostic> ParseToolDiagnostics(const std::string& output, const std::string& label);

std::string FormatDiagnostic(const Diagnostic& diagnostic);

} // namespace aiexec
