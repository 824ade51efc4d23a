#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <core/types.hpp>

enum class OutputMode { Json, Text };

std::optional<OutputMode> parse_output_mode(const std::string& name);

// One output stream after truncation. Lengths count UTF-8 code points.
struct RenderedField {
    std::string text;
    bool truncated = false;
    size_t original_length = 0;
};

// Appended to text renders of ssh_exec_command
struct ExecMetadata {
    std::string host;
    std::string user;
    std::string timestamp;
};

struct RenderedOutput {
    OutputMode mode = OutputMode::Text;
    RenderedField stdout_field;
    RenderedField stderr_field;
    int exit_code = 0;                        // -1 when timed out
    bool timed_out = false;
    std::chrono::milliseconds duration{0};
    std::string body;                         // the rendered block
};

// Pure rendering of command results; no I/O.
class OutputFormatter {
public:
    static RenderedField truncate(const std::string& s, size_t limit);

    static RenderedOutput format(const CommandResult& result, size_t limit, OutputMode mode,
                                 const std::optional<ExecMetadata>& meta = std::nullopt);

    static nlohmann::json to_json(const RenderedOutput& out);

    static std::string format_error(const std::string& message, const std::string& context = "");
};
