#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

// Switches and formatting helpers for the verbose pipeline trace (plog instance kLogInstance).
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Escapes line breaks and cuts at MaxPreview() bytes without splitting a UTF-8 sequence
    [[nodiscard]] static std::string Preview(std::string_view text);

    // "IM#801"
    [[nodiscard]] static std::string EpisodeTag(std::string_view prefix, int episode_number);

private:
    static void replaceControlChars(std::string& text);
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace processing
