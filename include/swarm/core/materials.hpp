/**
 * @file materials.hpp
 * @brief Surface materials and the contact rules registered between them
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

using MaterialId = std::uint32_t;

constexpr MaterialId NoMaterial = 0xFFFFFFFFu;

/**
 * @struct Material
 * @brief Named surface with its own friction and restitution
 */
struct Material {
    std::string name;
    double friction = 0.3;
    double restitution = 0.0;
};

/**
 * @struct ContactProperties
 * @brief Friction/restitution that apply to one colliding pair
 */
struct ContactProperties {
    double friction = 0.3;
    double restitution = 0.0;
};

/**
 * @class MaterialTable
 * @brief Registry of materials and of explicit contact rules between pairs
 *
 * Contact rules are symmetric: (a, b) and (b, a) refer to the same rule.
 * When no rule is registered the pair uses the product of both materials'
 * coefficients, or the default contact when either body has no material.
 */
class MaterialTable {
public:
    MaterialTable();

    MaterialId addMaterial(const Material& material);
    const Material* find(MaterialId id) const;

    /** @brief Id of the first material with this name, or NoMaterial */
    MaterialId findByName(const std::string& name) const;
    std::size_t materialCount() const { return materials.size(); }

    /**
     * @brief Registers a contact rule for a pair of materials
     * @return false if a rule for the pair already exists (the rule is left untouched)
     */
    bool addContactMaterial(MaterialId a, MaterialId b, const ContactProperties& props);
    bool hasContactMaterial(MaterialId a, MaterialId b) const;
    std::size_t contactMaterialCount() const { return contacts.size(); }

    /**
     * @brief Friction and restitution for a collision between two materials
     */
    ContactProperties resolve(MaterialId a, MaterialId b) const;

private:
    static std::pair<MaterialId, MaterialId> key(MaterialId a, MaterialId b);

    std::vector<Material> materials;
    std::map<std::pair<MaterialId, MaterialId>, ContactProperties> contacts;
    ContactProperties defaults;
};
