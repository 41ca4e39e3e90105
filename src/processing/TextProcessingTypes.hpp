#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace text_processing {

// Core data contracts for the transcript pipeline.
// All stages use these types as input/output to keep interfaces narrow.

// One episode document as read from disk
struct RawDocument {
    std::string markup;                       // Full HTML document
    std::string prefix;                       // Show prefix, e.g. "IM"
    std::string source_path;                  // File it was read from (diagnostics only)
    int episode_number = 0;                   // Parsed from file name or title, 0 if unknown
};

struct EpisodeMetadata {
    int episode_number = 0;
    std::string title = "Unknown Episode";
    std::string date_text = "Unknown Date";   // Human-readable, whitespace-normalized
    std::string date_key = "00-01-01";        // YY-MM-DD
    int year = 0;                             // 0 when unknown
};

// A standardized utterance. timestamp is non-empty for every matched line.
struct NormalizedLine {
    std::string timestamp;
    std::string speaker;
    std::string text;
};

struct NormalizedEpisode {
    EpisodeMetadata metadata;
    std::string body;                         // Standardized body, lines joined with '\n'
};

// Rendered episode ready for chunk assembly; counts are derived once here
struct RenderedEpisode {
    int episode_number = 0;
    int year = 0;
    std::string block;                        // "# Episode: ..." block including trailing rule
    std::size_t words = 0;                    // Whitespace fields of the body
    std::size_t bytes = 0;                    // block.size()
};

// Result of trying one timestamp shape against a line
struct NoMatch {};

struct MatchedWithText {
    NormalizedLine line;
};

// Marker line with nothing after it; text may come from the next line
struct MatchedNeedingLookahead {
    NormalizedLine line;
};

using MatchResult = std::variant<NoMatch, MatchedWithText, MatchedNeedingLookahead>;

// Pipeline execution result wrapper (common for all stages)
template<typename T>
struct StageResult {
    T result;                                 // The actual result payload
    bool succeeded = true;                    // Whether the stage completed successfully
    std::optional<std::string> error;         // Error message if stage failed
    std::chrono::microseconds duration{0};    // How long the stage took to execute
    std::string stage_name;                   // Name of the stage (for logging/metrics)

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

} // namespace text_processing
