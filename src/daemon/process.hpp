#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Exit status the forked child reports when execvp() fails.
inline constexpr int kExecFailedStatus = 127;

struct ProcessError {
    std::string message;
    bool not_found = false; // the program could not be executed at all
};

// fork + execvp + waitpid. `input`, if given, is written to the child's stdin
// through a pipe which is then closed. Succeeds only on exit status 0.
std::expected<void, ProcessError> run_process(const std::vector<std::string>& argv,
                                              std::optional<std::string_view> input = std::nullopt);
