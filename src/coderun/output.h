#ifndef CODERUN_OUTPUT_H_
#define CODERUN_OUTPUT_H_

#include <string>
#include <optional>
#include <string_view>

#include <coderun/execution.h>

extern const char kTruncatedMarker[];

// Decode as UTF-8, replacing invalid sequences by U+FFFD. If the decoded text is longer
// than max_bytes, cut it at a character boundary and append kTruncatedMarker.
std::string SanitizeOutput(std::string_view raw, size_t max_bytes);

// Outcome of a finished sandbox run. Priority: timeout, killed, runtime error, success.
// A non-zero exit without any output is regarded as a kill by the runtime or the OS
// (typically OOM); this is a heuristic, since programs may also exit silently.
// A missing exit code without timeout counts as non-zero.
Status Classify(bool timed_out, std::optional<int> exit_code,
                const std::string& output, const std::string& error);

#endif  // CODERUN_OUTPUT_H_
