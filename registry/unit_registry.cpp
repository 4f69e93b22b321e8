#include "unit_registry.hpp"
#include <common/logging.hpp>
#include <shapes/flying_geese_unit.hpp>
#include <shapes/hst_unit.hpp>
#include <shapes/qst_unit.hpp>
#include <shapes/square_unit.hpp>
#include <algorithm>

namespace quiltblock {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::string unknown_type_message(const std::string& type_id, const std::vector<std::string>& known_ids) {
    std::string known = known_ids.empty() ? "(none)" : join(known_ids, ", ");
    return "Unknown unit type: \"" + type_id + "\". Registered types: " + known;
}

}  // namespace

UnknownUnitTypeError::UnknownUnitTypeError(const std::string& type_id,
                                           const std::vector<std::string>& known_ids)
    : std::runtime_error(unknown_type_message(type_id, known_ids)),
      type_id_(type_id),
      known_ids_(known_ids) {}

void UnitRegistry::register_definition(std::unique_ptr<UnitDefinition> definition) {
    if (!definition) {
        throw RegistrationError("Cannot register a null unit definition");
    }

    const std::string type_id = definition->type_id();

    if (frozen_) {
        throw RegistrationError(
            "UnitRegistry is frozen. Cannot register \"" + type_id + "\". "
            "Units must be registered during initialization.");
    }

    if (index_.count(type_id) > 0) {
        throw RegistrationError(
            "Unit type \"" + type_id + "\" is already registered. "
            "Each unit type must have a unique typeId.");
    }

    validate_definition(*definition);

    auto log = logging::get_logger();
    log->debug("Registered unit type '{}' ({} patches, {} variants)",
               type_id, definition->patches().size(), definition->variants().size());

    index_[type_id] = definitions_.size();
    definitions_.push_back(std::move(definition));
}

void UnitRegistry::validate_definition(const UnitDefinition& definition) const {
    const std::string type_id = definition.type_id();

    if (type_id.empty()) {
        throw RegistrationError("Unit definition must have a non-empty typeId string");
    }

    if (definition.display_name().empty()) {
        throw RegistrationError("Unit \"" + type_id + "\" must have a displayName");
    }

    if (definition.patches().empty()) {
        throw RegistrationError("Unit \"" + type_id + "\" must have at least one patch");
    }

    const auto& variants = definition.variants();
    if (!variants.empty()) {
        auto default_variant = definition.default_variant();
        if (!default_variant) {
            throw RegistrationError("Unit \"" + type_id + "\" has variants but no defaultVariant");
        }

        std::vector<std::string> variant_ids;
        for (const auto& v : variants) {
            variant_ids.push_back(v.id);
        }
        if (std::find(variant_ids.begin(), variant_ids.end(), *default_variant) == variant_ids.end()) {
            throw RegistrationError(
                "Unit \"" + type_id + "\" defaultVariant \"" + *default_variant +
                "\" is not in variants: " + join(variant_ids, ", "));
        }
    }
}

const UnitDefinition* UnitRegistry::get(const std::string& type_id) const {
    auto it = index_.find(type_id);
    if (it == index_.end()) {
        return nullptr;
    }
    return definitions_[it->second].get();
}

const UnitDefinition& UnitRegistry::get_or_throw(const std::string& type_id) const {
    const UnitDefinition* definition = get(type_id);
    if (!definition) {
        throw UnknownUnitTypeError(type_id, get_type_ids());
    }
    return *definition;
}

bool UnitRegistry::has(const std::string& type_id) const {
    return index_.count(type_id) > 0;
}

std::vector<const UnitDefinition*> UnitRegistry::get_all() const {
    std::vector<const UnitDefinition*> result;
    result.reserve(definitions_.size());
    for (const auto& d : definitions_) {
        result.push_back(d.get());
    }
    return result;
}

std::vector<const UnitDefinition*> UnitRegistry::get_by_category(UnitCategory category) const {
    std::vector<const UnitDefinition*> result;
    for (const auto& d : definitions_) {
        if (d->category() == category) {
            result.push_back(d.get());
        }
    }
    return result;
}

std::vector<std::string> UnitRegistry::get_type_ids() const {
    std::vector<std::string> ids;
    ids.reserve(definitions_.size());
    for (const auto& d : definitions_) {
        ids.push_back(d->type_id());
    }
    return ids;
}

void UnitRegistry::clear() {
    definitions_.clear();
    index_.clear();
    frozen_ = false;
}

void register_builtin_units(UnitRegistry& registry) {
    registry.register_definition(std::make_unique<SquareUnit>());
    registry.register_definition(std::make_unique<HstUnit>());
    registry.register_definition(std::make_unique<FlyingGeeseUnit>());
    registry.register_definition(std::make_unique<QstUnit>());
}

const UnitRegistry& builtin_registry() {
    static const UnitRegistry& registry = [] () -> const UnitRegistry& {
        static UnitRegistry instance;
        register_builtin_units(instance);
        instance.freeze();
        return instance;
    }();
    return registry;
}

}  // namespace quiltblock
