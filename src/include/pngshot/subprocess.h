#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * \file subprocess.h
 * \brief Blocking child-process runner with captured stdout/stderr.
 */

namespace pngshot {

enum class ProcessStatus : uint8_t {
    /// The child ran and exited; see \ref ProcessResult::exit_code.
    Ok,
    /// The executable could not be resolved on `PATH`.
    NotFound,
    SpawnFailed,
    WaitFailed,
    /// The child was terminated by a signal.
    Signaled,
};

const char*
process_status_name(ProcessStatus status) noexcept;

struct ProcessOptions final {
    /// Program name (resolved on `PATH`) or path.
    std::string executable;
    std::vector<std::string> args;

    bool capture_stdout = true;
    bool capture_stderr = true;
};

struct ProcessResult final {
    ProcessStatus status = ProcessStatus::Ok;
    int exit_code        = -1;
    /// errno of a failed spawn or wait.
    int error_number = 0;
    std::string stdout_text;
    std::string stderr_text;
};

/**
 * \brief Runs \p options.executable to completion.
 *
 * stdin is `/dev/null`. Streams not captured go to `/dev/null` as well.
 * There is no timeout: a child that never exits blocks the caller.
 */
ProcessResult
run_process(const ProcessOptions& options);

}  // namespace pngshot
