#pragma once

#include "archive/IArtifactSink.hpp"

#include <string>
#include <vector>

namespace test_utils {

// Collects artifacts in memory; names listed in fail_names are refused
class MemorySink : public archive::IArtifactSink {
public:
    bool write(const archive::OutputArtifact& artifact) override {
        for (const auto& name : fail_names) {
            if (name == artifact.name)
                return false;
        }
        artifacts.push_back(artifact);
        return true;
    }

    std::vector<archive::OutputArtifact> artifacts;
    std::vector<std::string> fail_names;
};

} // namespace test_utils
