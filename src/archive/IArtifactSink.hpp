#pragma once

#include "ChunkTypes.hpp"

namespace archive
{

class IArtifactSink
{
public:
    virtual ~IArtifactSink() = default;

    // Persists one artifact; false when it could not be stored
    [[nodiscard]] virtual bool write(const OutputArtifact& artifact) = 0;
};

} // namespace archive
