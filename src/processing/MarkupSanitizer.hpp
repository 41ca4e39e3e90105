#pragma once

#include <string>
#include <string_view>

namespace processing
{

// Turns transcript HTML into Markdown-flavoured plain text.
//
// script/style blocks are dropped first; h1-h3, p, br, b/strong, i/em, ul/li and
// anchors are mapped to Markdown; every other tag is removed. Anchors keep their
// target only for "/", "http://" and "https://" URLs. A fixed set of named
// entities is decoded, lines are trimmed and blank runs collapsed to one.
//
// sanitize() is idempotent: the single pass is repeated until the text stops
// changing. Every pass that changes the text makes it strictly shorter, so the
// loop always terminates.
class MarkupSanitizer
{
public:
    [[nodiscard]] std::string sanitize(const std::string& markup) const;

    // One pass of every rule; exposed for tests
    [[nodiscard]] std::string sanitizeOnce(const std::string& markup) const;

    [[nodiscard]] static bool isSafeLinkTarget(std::string_view target) noexcept;

    // Decodes &nbsp; &amp; &lt; &gt; &quot; &#39; in a single left-to-right pass
    [[nodiscard]] static std::string decodeEntities(const std::string& text);

    // Removes every tag-like construct ("<x...>", "</x...>", "<!...>", "<?...>") without conversion
    [[nodiscard]] static std::string stripTags(const std::string& text);

private:
    std::string removeHiddenBlocks(const std::string& input) const;
    std::string convertPaired(const std::string& input, std::string_view tag, std::string_view open_repl,
                              std::string_view close_repl) const;
    std::string convertStandalone(const std::string& input, std::string_view tag, bool closing,
                                  std::string_view repl) const;
    std::string convertAnchors(const std::string& input) const;
};

} // namespace processing
