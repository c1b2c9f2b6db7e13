#include <doctest/doctest.h>

#include <nodememo/node/NodeConstructor.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace NM;

namespace {

struct TextArtifact final : Artifact {
    explicit TextArtifact(std::string text, std::size_t weight = 1) : text(std::move(text)), weight(weight) {}

    auto estimatedSize() const -> std::size_t override { return weight; }

    std::string text;
    std::size_t weight;
};

// Renders "<type padding>" from the resolved props and counts invocations.
class RecordingBuilder final : public ArtifactBuilder {
public:
    auto build(std::string_view elementType, Value const& resolvedProps, std::string const& stableKey)
        -> Expected<ArtifactRef> override {
        ++builds;
        keys.push_back(stableKey);
        if (fail) {
            return std::unexpected(make_error("renderer offline", Error::Code::NotSupported));
        }
        std::string text{elementType};
        if (resolvedProps.isObject()) {
            if (auto const* padding = resolvedProps.asObject()->find("padding"); padding && padding->isString()) {
                text += " " + padding->asString();
            }
        }
        return std::make_shared<TextArtifact const>(text, weight);
    }

    int                      builds = 0;
    bool                     fail   = false;
    std::size_t              weight = 1;
    std::vector<std::string> keys;
};

auto text_of(ElementHandle const& handle) -> std::string const& {
    return static_cast<TextArtifact const&>(*handle.artifact).text;
}

auto keyed_request(Value props, std::vector<Value> deps = {}) -> NodeRequest {
    NodeRequest request;
    request.element_type = "div";
    request.props        = std::move(props);
    request.deps         = std::move(deps);
    request.position     = "root_0";
    return request;
}

} // namespace

TEST_SUITE("node.construct") {

TEST_CASE("identical props return the identical cached artifact") {
    CacheContext     context;
    RecordingBuilder builder;

    auto first  = construct_node(context, builder, keyed_request(makeObject({{"padding", "4px"}})));
    auto second = construct_node(context, builder, keyed_request(makeObject({{"padding", "4px"}})));

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->artifact.get() == second->artifact.get());
    CHECK(first->boundary.get() == second->boundary.get());
    CHECK_FALSE(first->cache_hit);
    CHECK(second->cache_hit);
    CHECK(builder.builds == 1);
    CHECK(context.elements().find(first->stable_key)->access_count == 1);
}

TEST_CASE("a changed prop rebuilds inside the existing boundary") {
    CacheContext     context;
    RecordingBuilder builder;

    auto first = construct_node(context, builder, keyed_request(makeObject({{"padding", "4px"}})));
    REQUIRE(first.has_value());
    first->boundary->mount();

    auto second = construct_node(context, builder, keyed_request(makeObject({{"padding", "8px"}})));
    REQUIRE(second.has_value());

    CHECK(builder.builds == 2);
    CHECK(first->artifact.get() != second->artifact.get());
    CHECK(text_of(*second) == "div 8px");
    CHECK(second->boundary.get() == first->boundary.get());
    CHECK(second->boundary->isMounted());
    CHECK(context.mountTracker()->isMounted(second->stable_key));
    CHECK(context.elements().size() == 1);
}

TEST_CASE("a cache hit never disturbs the mounted boundary") {
    CacheContext     context;
    RecordingBuilder builder;

    auto first = construct_node(context, builder, keyed_request(makeObject({{"padding", "4px"}})));
    REQUIRE(first.has_value());
    first->boundary->mount();

    for (int render = 0; render < 5; ++render) {
        auto again = construct_node(context, builder, keyed_request(makeObject({{"padding", "4px"}})));
        REQUIRE(again.has_value());
        CHECK(again->boundary.get() == first->boundary.get());
    }
    CHECK(context.mountTracker()->isMounted(first->stable_key));
    CHECK(context.mountTracker()->strayUnmountCount(first->stable_key) == 0);
}

TEST_CASE("nodes without a dependency list are never cached") {
    CacheContext     context;
    RecordingBuilder builder;

    NodeRequest request;
    request.element_type = "span";
    request.props        = makeObject({{"padding", "1px"}});

    auto first  = construct_node(context, builder, request);
    auto second = construct_node(context, builder, request);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    CHECK(builder.builds == 2);
    CHECK(first->artifact.get() != second->artifact.get());
    CHECK(first->boundary == nullptr);
    CHECK(context.elements().empty());
}

TEST_CASE("dependency changes force a rebuild") {
    CacheContext     context;
    RecordingBuilder builder;
    auto             props = makeObject({{"padding", "4px"}});

    auto first  = construct_node(context, builder, keyed_request(props, {Value{1}}));
    auto same   = construct_node(context, builder, keyed_request(props, {Value{1}}));
    auto bumped = construct_node(context, builder, keyed_request(props, {Value{2}}));

    REQUIRE(bumped.has_value());
    CHECK(same->cache_hit);
    CHECK_FALSE(bumped->cache_hit);
    CHECK(builder.builds == 2);
}

TEST_CASE("stable keys come from the explicit key or from type and position") {
    CacheContext     context;
    RecordingBuilder builder;

    auto explicitRequest = keyed_request(makeObject());
    explicitRequest.key  = "header";
    auto keyed           = construct_node(context, builder, explicitRequest);
    REQUIRE(keyed.has_value());
    CHECK(keyed->stable_key == "header");

    auto derived = construct_node(context, builder, keyed_request(makeObject()));
    REQUIRE(derived.has_value());
    CHECK(derived->stable_key == derive_stable_key("div", "root_0"));
    CHECK(derive_stable_key("div", "root_0") != derive_stable_key("div", child_position("root", 1)));
    CHECK(child_position("root_0", 3) == "root_0_3");
}

TEST_CASE("theme resolution feeds the builder and the theme keys the slot") {
    CacheContext     context;
    RecordingBuilder builder;

    Theme light{"light", makeObject({{"spacing", makeObject({{"md", "16px"}})}})};
    Theme dark{"dark", makeObject({{"spacing", makeObject({{"md", "8px"}})}})};
    auto  props = makeObject({{"padding", "theme.spacing.md"}});

    auto lit = construct_node(context, builder, keyed_request(props), &light);
    REQUIRE(lit.has_value());
    CHECK(text_of(*lit) == "div 16px");

    auto darkened = construct_node(context, builder, keyed_request(props), &dark);
    REQUIRE(darkened.has_value());
    CHECK_FALSE(darkened->cache_hit);
    CHECK(text_of(*darkened) == "div 8px");
    CHECK(props->get("padding").asString() == "theme.spacing.md");
}

TEST_CASE("builder failures surface and leave the cache untouched") {
    CacheContext     context;
    RecordingBuilder builder;

    auto first = construct_node(context, builder, keyed_request(makeObject({{"padding", "4px"}})));
    REQUIRE(first.has_value());

    builder.fail = true;
    auto failed  = construct_node(context, builder, keyed_request(makeObject({{"padding", "8px"}})));
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code == Error::Code::BuildFailed);
    CHECK(context.elements().find(first->stable_key)->artifact.get() == first->artifact.get());

    NodeRequest nameless;
    auto        rejected = construct_node(context, builder, nameless);
    REQUIRE_FALSE(rejected.has_value());
    CHECK(rejected.error().code == Error::Code::MalformedInput);
}

TEST_CASE("owners and sizes are recorded on the entry") {
    CacheContext     context;
    RecordingBuilder builder;
    builder.weight = 7;

    auto owner   = std::make_shared<int>(1);
    auto request = keyed_request(makeObject());
    request.owner = owner;

    auto handle = construct_node(context, builder, request);
    REQUIRE(handle.has_value());
    auto const* entry = context.elements().find(handle->stable_key);
    REQUIRE(entry != nullptr);
    CHECK(entry->estimated_size == 7);
    CHECK(entry->has_owner);
    CHECK_FALSE(entry->ownerExpired());

    owner.reset();
    CHECK(entry->ownerExpired());
}

TEST_CASE("clearCaches retires boundaries and empties the mount set") {
    CacheContext     context;
    RecordingBuilder builder;

    auto handle = construct_node(context, builder, keyed_request(makeObject()));
    REQUIRE(handle.has_value());
    handle->boundary->mount();

    context.clearCaches();
    CHECK(context.elements().empty());
    CHECK(context.mountTracker()->mountedCount() == 0);
    CHECK(handle->boundary->isRetired());
    CHECK_FALSE(handle->boundary->unmount());
}

} // TEST_SUITE
