#pragma once

#include <string>
#include <vector>

// Result of running an external process to completion
struct ProcessResult {
    bool launched;       // false if fork/exec failed
    int exit_code;       // Exit status; -1 if not launched or killed by a signal
    std::string output;  // Captured stdout (and stderr when merged)

    ProcessResult() : launched(false), exit_code(-1) {}

    bool succeeded() const { return launched && exit_code == 0; }
};

// Launches external tools (yt-dlp, ffmpeg, curl) with an explicit argument
// vector. No shell is involved, so arguments never need escaping.
class ProcessLauncher {
public:
    // Run a process and wait for it.
    // capture_output: collect stdout into ProcessResult::output, otherwise discard it
    // redirect_stderr: merge stderr into the captured stream (2>&1), otherwise discard it
    static ProcessResult run(
        const std::string& executable,
        const std::vector<std::string>& arguments,
        bool capture_output = false,
        bool redirect_stderr = false
    );

    // Same as run(), but the executable may be a command string with leading
    // arguments (e.g. "python3 -m yt_dlp"), which is split with parseCommand()
    static ProcessResult runCommand(
        const std::string& command,
        const std::vector<std::string>& arguments,
        bool capture_output = false,
        bool redirect_stderr = false
    );

    // Parse a command string into executable path and arguments.
    // Arguments are space-separated; double-quoted strings are preserved.
    static bool parseCommand(
        const std::string& command,
        std::string& executable,
        std::vector<std::string>& arguments
    );
};
