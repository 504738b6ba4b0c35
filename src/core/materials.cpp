#include "swarm/core/materials.hpp"
#include "swarm/core/constants.hpp"

#include <algorithm>

MaterialTable::MaterialTable() {
    defaults.friction = SwarmConstants::DefaultContactFriction;
    defaults.restitution = SwarmConstants::DefaultContactRestitution;
}

MaterialId MaterialTable::addMaterial(const Material& material) {
    materials.push_back(material);
    return static_cast<MaterialId>(materials.size() - 1);
}

const Material* MaterialTable::find(MaterialId id) const {
    if (id == NoMaterial || id >= materials.size()) {
        return nullptr;
    }
    return &materials[id];
}

MaterialId MaterialTable::findByName(const std::string& name) const {
    auto it = std::find_if(materials.begin(), materials.end(),
                           [&name](const Material& m) { return m.name == name; });
    if (it == materials.end()) {
        return NoMaterial;
    }
    return static_cast<MaterialId>(it - materials.begin());
}

std::pair<MaterialId, MaterialId> MaterialTable::key(MaterialId a, MaterialId b) {
    return {std::min(a, b), std::max(a, b)};
}

bool MaterialTable::addContactMaterial(MaterialId a, MaterialId b, const ContactProperties& props) {
    return contacts.emplace(key(a, b), props).second;
}

bool MaterialTable::hasContactMaterial(MaterialId a, MaterialId b) const {
    return contacts.find(key(a, b)) != contacts.end();
}

ContactProperties MaterialTable::resolve(MaterialId a, MaterialId b) const {
    auto it = contacts.find(key(a, b));
    if (it != contacts.end()) {
        return it->second;
    }

    const Material* ma = find(a);
    const Material* mb = find(b);
    if (!ma || !mb) {
        return defaults;
    }

    ContactProperties out;
    out.friction = ma->friction * mb->friction;
    out.restitution = ma->restitution * mb->restitution;
    return out;
}
