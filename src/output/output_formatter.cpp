#include "output_formatter.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <vector>

std::optional<OutputMode> parse_output_mode(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "json") return OutputMode::Json;
    if (lower == "text") return OutputMode::Text;
    return std::nullopt;
}

RenderedField OutputFormatter::truncate(const std::string& s, size_t limit) {
    RenderedField field;
    field.original_length = utf8_length(s);
    if (field.original_length > limit) {
        field.text = s.substr(0, utf8_prefix_bytes(s, limit));
        field.truncated = true;
    } else {
        field.text = s;
    }
    return field;
}

static std::string truncation_note(const char* stream, const RenderedField& f, size_t limit) {
    return fmt::format("[{} TRUNCATED - showing first {} of {} characters]",
                       stream, limit, f.original_length);
}

RenderedOutput OutputFormatter::format(const CommandResult& result, size_t limit,
                                       OutputMode mode,
                                       const std::optional<ExecMetadata>& meta) {
    RenderedOutput out;
    out.mode = mode;
    out.stdout_field = truncate(result.stdout_data, limit);
    out.stderr_field = truncate(result.stderr_data, limit);
    out.timed_out = result.timed_out;
    out.exit_code = (result.timed_out || !result.exit_code) ? -1 : *result.exit_code;
    out.duration = result.duration;

    if (mode == OutputMode::Json) {
        out.body = to_json(out).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        return out;
    }

    std::vector<std::string> sections;
    if (!out.stdout_field.text.empty()) {
        std::string s = "=== STDOUT ===\n" + out.stdout_field.text;
        if (out.stdout_field.truncated) s += "\n" + truncation_note("STDOUT", out.stdout_field, limit);
        sections.push_back(s);
    }
    if (!out.stderr_field.text.empty()) {
        std::string s = "=== STDERR ===\n" + out.stderr_field.text;
        if (out.stderr_field.truncated) s += "\n" + truncation_note("STDERR", out.stderr_field, limit);
        sections.push_back(s);
    }

    std::string status = fmt::format("=== EXIT CODE: {} ===\nDuration: {} ms",
                                     out.exit_code, out.duration.count());
    if (out.timed_out) status += "\n[WARNING] EXECUTION TIMED OUT";
    sections.push_back(status);

    if (meta) {
        sections.push_back(fmt::format("Host: {}\nUser: {}\nTimestamp: {}",
                                       meta->host, meta->user, meta->timestamp));
    }

    for (size_t i = 0; i < sections.size(); ++i) {
        if (i > 0) out.body += "\n\n";
        out.body += sections[i];
    }
    return out;
}

nlohmann::json OutputFormatter::to_json(const RenderedOutput& out) {
    return {
        {"stdout", out.stdout_field.text},
        {"stderr", out.stderr_field.text},
        {"exit_code", out.exit_code},
        {"stdout_truncated", out.stdout_field.truncated},
        {"stderr_truncated", out.stderr_field.truncated},
        {"stdout_original_length", out.stdout_field.original_length},
        {"stderr_original_length", out.stderr_field.original_length},
        {"duration_ms", out.duration.count()},
        {"timed_out", out.timed_out},
    };
}

std::string OutputFormatter::format_error(const std::string& message, const std::string& context) {
    std::string content = "[ERROR] " + message;
    if (!context.empty()) content += "\n\nContext: " + context;
    return content;
}
