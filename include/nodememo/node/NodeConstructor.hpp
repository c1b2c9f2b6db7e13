#pragma once

#include <nodememo/core/CacheContext.hpp>
#include <nodememo/core/Error.hpp>
#include <nodememo/lifecycle/LifecycleBoundary.hpp>
#include <nodememo/node/Artifact.hpp>
#include <nodememo/node/StableKey.hpp>
#include <nodememo/theme/Theme.hpp>
#include <nodememo/theme/ThemeGraphResolver.hpp>
#include <nodememo/value/Value.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace NM {

struct NodeRequest {
    std::string element_type;
    Value       props;
    // Without a dependency list the node is rebuilt on every call and never cached.
    std::optional<std::vector<Value>> deps;
    std::optional<std::string>        key;
    // Structural position used to derive the key when none is given.
    std::string position{"root"};
    // Optional caller node object; see CacheEntry::owner.
    std::weak_ptr<void const> owner;
    ResolveOptions            resolve;
};

struct ElementHandle {
    ArtifactRef artifact;
    // Shared with the cache entry; null for uncached nodes.
    std::shared_ptr<LifecycleBoundary> boundary;
    StableKey                          stable_key;
    bool                               cache_hit = false;
};

// Canonical signature of a node: element type, raw props, dependency list and
// the theme (mode and system).
[[nodiscard]] auto node_signature(NodeRequest const& request, Theme const* theme) -> Encoding::Signature;

/**
 * Builds or reuses the artifact for one node.
 *
 * A cached slot whose signature matches hands back the stored artifact and
 * boundary untouched. A changed signature rebuilds and swaps the artifact
 * inside the slot's existing boundary; only a new slot creates a boundary.
 * A failing builder leaves the cache as it was.
 */
auto construct_node(CacheContext& context,
                    ArtifactBuilder& builder,
                    NodeRequest const& request,
                    Theme const* theme = nullptr) -> Expected<ElementHandle>;

} // namespace NM
