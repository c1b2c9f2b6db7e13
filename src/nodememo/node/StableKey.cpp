#include <nodememo/node/StableKey.hpp>

#include <nodememo/encode/CanonicalEncoder.hpp>

namespace NM {

auto derive_stable_key(std::string_view elementType,
                       std::string_view position,
                       std::optional<std::string> const& explicitKey) -> StableKey {
    if (explicitKey && !explicitKey->empty()) {
        return *explicitKey;
    }
    std::string material;
    material.reserve(elementType.size() + 1 + position.size());
    material.append(elementType);
    material.push_back('|');
    material.append(position);
    return Encoding::hashString(material);
}

auto child_position(std::string_view parentPosition, std::size_t index) -> std::string {
    std::string position{parentPosition};
    position.push_back('_');
    position.append(std::to_string(index));
    return position;
}

} // namespace NM
