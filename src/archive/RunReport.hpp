#pragma once

#include "PrefixProcessor.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace archive
{

// Per-prefix outcomes of one run plus totals; serialized with --report
class RunReport
{
public:
    void add(PrefixSummary summary);

    [[nodiscard]] const std::vector<PrefixSummary>& prefixes() const noexcept { return prefixes_; }

    [[nodiscard]] std::size_t totalProcessed() const;
    [[nodiscard]] std::size_t totalSkipped() const;
    [[nodiscard]] std::size_t totalArtifactsWritten() const;
    [[nodiscard]] std::size_t totalArtifactsFailed() const;

    [[nodiscard]] nlohmann::json toJson() const;

    // Pretty-printed JSON written through a temporary file
    [[nodiscard]] bool writeTo(const std::filesystem::path& path) const;

    // "processed 12, skipped 1, artifacts written 2, artifacts failed 0"
    [[nodiscard]] std::string summaryLine() const;

private:
    std::vector<PrefixSummary> prefixes_;
};

} // namespace archive
