#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Directory holding the running executable (falls back to the current directory).
std::filesystem::path executable_dir();

// Resolve a program name the way execvp would. Names containing '/' are
// checked directly; others are searched on PATH.
std::optional<std::filesystem::path> find_program(const std::string& program);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
