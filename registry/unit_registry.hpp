#ifndef QUILTBLOCK_REGISTRY_UNIT_REGISTRY_HPP
#define QUILTBLOCK_REGISTRY_UNIT_REGISTRY_HPP

#include "unit_definition.hpp"
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace quiltblock {

// Thrown when a definition is rejected by register_definition()
class RegistrationError : public std::runtime_error {
public:
    explicit RegistrationError(const std::string& msg) : std::runtime_error(msg) {}
};

// Thrown by get_or_throw() for an id nobody registered
class UnknownUnitTypeError : public std::runtime_error {
public:
    UnknownUnitTypeError(const std::string& type_id, const std::vector<std::string>& known_ids);

    const std::string& type_id() const { return type_id_; }
    const std::vector<std::string>& known_ids() const { return known_ids_; }

private:
    std::string type_id_;
    std::vector<std::string> known_ids_;
};

// Catalog of unit definitions keyed by type id. Iteration follows
// registration order.
class UnitRegistry {
public:
    UnitRegistry() = default;
    UnitRegistry(const UnitRegistry&) = delete;
    UnitRegistry& operator=(const UnitRegistry&) = delete;

    void register_definition(std::unique_ptr<UnitDefinition> definition);

    // Lookup. get() returns nullptr when absent.
    const UnitDefinition* get(const std::string& type_id) const;
    const UnitDefinition& get_or_throw(const std::string& type_id) const;
    bool has(const std::string& type_id) const;

    std::vector<const UnitDefinition*> get_all() const;
    std::vector<const UnitDefinition*> get_by_category(UnitCategory category) const;
    std::vector<std::string> get_type_ids() const;
    size_t size() const { return definitions_.size(); }

    // Once frozen, registration throws
    void freeze() { frozen_ = true; }
    void unfreeze() { frozen_ = false; }
    bool is_frozen() const { return frozen_; }

    // Drop all definitions and unfreeze
    void clear();

private:
    void validate_definition(const UnitDefinition& definition) const;

    std::vector<std::unique_ptr<UnitDefinition>> definitions_;
    std::map<std::string, size_t> index_;
    bool frozen_ = false;
};

// Register square, hst, flying_geese and qst
void register_builtin_units(UnitRegistry& registry);

// Process-wide registry holding the built-in units, populated on first
// use and frozen
const UnitRegistry& builtin_registry();

}  // namespace quiltblock

#endif // QUILTBLOCK_REGISTRY_UNIT_REGISTRY_HPP
