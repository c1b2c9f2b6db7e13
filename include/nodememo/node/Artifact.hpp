#pragma once

#include <nodememo/core/Error.hpp>
#include <nodememo/value/Value.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace NM {

// Render output produced by the host for one node. NodeMemo never looks
// inside; it only stores, hands back and weighs artifacts.
class Artifact {
public:
    virtual ~Artifact() = default;

    // Relative weight used by the emergency sweep; treated as at least 1.
    [[nodiscard]] virtual auto estimatedSize() const -> std::size_t { return 1; }
};

using ArtifactRef = std::shared_ptr<Artifact const>;

// Host capability that turns resolved props into an artifact.
class ArtifactBuilder {
public:
    virtual ~ArtifactBuilder() = default;

    virtual auto build(std::string_view elementType, Value const& resolvedProps, std::string const& stableKey)
        -> Expected<ArtifactRef> = 0;
};

} // namespace NM
