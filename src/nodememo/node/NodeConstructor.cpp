#include <nodememo/node/NodeConstructor.hpp>

#include <nodememo/encode/CanonicalEncoder.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace NM {

namespace {

auto resolve_props(CacheContext& context,
                   NodeRequest const& request,
                   Theme const* theme,
                   Encoding::Signature const* signature) -> Value {
    if (theme == nullptr || themeIsEmpty(*theme)) {
        return request.props;
    }
    bool const shareable = signature != nullptr && !request.resolve.process_functions;
    if (shareable) {
        if (auto cached = context.propsCache().get(*signature)) {
            return *cached;
        }
    }
    Value resolved = context.resolver().resolve(request.props, *theme, request.resolve);
    if (shareable) {
        context.propsCache().set(*signature, resolved);
    }
    return resolved;
}

auto build_artifact(ArtifactBuilder& builder,
                    NodeRequest const& request,
                    Value const& props,
                    StableKey const& key) -> Expected<ArtifactRef> {
    auto built = builder.build(request.element_type, props, key);
    if (!built) {
        auto message = "building " + request.element_type + " failed: " + describeError(built.error());
        return std::unexpected(make_error(std::move(message), Error::Code::BuildFailed));
    }
    if (!*built) {
        return std::unexpected(
            make_error("building " + request.element_type + " produced no artifact", Error::Code::BuildFailed));
    }
    return built;
}

} // namespace

auto node_signature(NodeRequest const& request, Theme const* theme) -> Encoding::Signature {
    auto deps = std::make_shared<Array>();
    if (request.deps) {
        deps->items = *request.deps;
    }
    auto description = makeObject({
        {"type", request.element_type},
        {"props", request.props},
        {"deps", deps},
        {"themeMode", theme ? Value{theme->mode} : Value{nullptr}},
        {"themeSystem", theme && theme->system ? Value{theme->system} : Value{nullptr}},
    });
    return Encoding::encode(description);
}

auto construct_node(CacheContext& context,
                    ArtifactBuilder& builder,
                    NodeRequest const& request,
                    Theme const* theme) -> Expected<ElementHandle> {
    if (request.element_type.empty()) {
        return std::unexpected(make_error("element type must not be empty", Error::Code::MalformedInput));
    }

    if (!request.deps) {
        auto props    = resolve_props(context, request, theme, nullptr);
        auto artifact = build_artifact(builder, request, props, StableKey{});
        if (!artifact) {
            return std::unexpected(artifact.error());
        }
        return ElementHandle{std::move(*artifact), nullptr, StableKey{}, false};
    }

    auto const key       = derive_stable_key(request.element_type, request.position, request.key);
    auto const signature = node_signature(request, theme);
    auto const now       = context.now();

    if (auto* entry = context.elements().find(key); entry != nullptr && entry->signature == signature) {
        ++entry->access_count;
        entry->last_access = now;
        if (!request.owner.expired()) {
            entry->owner     = request.owner;
            entry->has_owner = true;
        }
        nm_log("Cache hit for " + key, "NodeCache");
        return ElementHandle{entry->artifact, entry->boundary, key, true};
    }

    auto props    = resolve_props(context, request, theme, &signature);
    auto artifact = build_artifact(builder, request, props, key);
    if (!artifact) {
        nm_log(describeError(artifact.error()), "NodeCache", "WARN");
        return std::unexpected(artifact.error());
    }
    auto const size = std::max<std::size_t>((*artifact)->estimatedSize(), 1);

    if (auto* entry = context.elements().find(key)) {
        entry->signature      = signature;
        entry->artifact       = *artifact;
        entry->created_at     = now;
        entry->last_access    = now;
        entry->estimated_size = size;
        ++entry->access_count;
        if (!request.owner.expired()) {
            entry->owner     = request.owner;
            entry->has_owner = true;
        }
        nm_log("Signature changed for " + key + ", artifact swapped", "NodeCache");
        return ElementHandle{entry->artifact, entry->boundary, key, false};
    }

    CacheEntry entry;
    entry.signature      = signature;
    entry.artifact       = *artifact;
    entry.boundary       = std::make_shared<LifecycleBoundary>(context.mountTracker(), key);
    entry.owner          = request.owner;
    entry.has_owner      = !request.owner.expired();
    entry.created_at     = now;
    entry.last_access    = now;
    entry.access_count   = 0;
    entry.estimated_size = size;

    auto& stored = context.elements().insert(key, std::move(entry));
    nm_log("Cached new slot " + key, "NodeCache");
    return ElementHandle{stored.artifact, stored.boundary, key, false};
}

} // namespace NM
