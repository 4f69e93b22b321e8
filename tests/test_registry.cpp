#include <gtest/gtest.h>
#include <geometry/primitives.hpp>
#include <registry/unit_registry.hpp>
#include <shapes/flying_geese_unit.hpp>
#include <shapes/square_unit.hpp>
#include <memory>
#include <set>

using namespace quiltblock;

namespace {

// Minimal definition whose metadata each test can break
class StubUnit : public UnitDefinition {
public:
    std::string id = "stub";
    std::string name = "Stub";
    std::vector<PatchDefinition> patch_list = {{"fill", "Fill", "background"}};
    std::vector<VariantDefinition> variant_list;
    std::optional<std::string> default_variant_id;

    std::string type_id() const override { return id; }
    std::string display_name() const override { return name; }
    UnitCategory category() const override { return UnitCategory::Advanced; }
    std::string description() const override { return "Test unit"; }
    Span default_span() const override { return {1, 1}; }
    SpanBehavior span_behavior() const override { return span_behavior::Fixed{{1, 1}}; }
    const std::vector<PatchDefinition>& patches() const override { return patch_list; }
    const std::vector<VariantDefinition>& variants() const override { return variant_list; }
    std::optional<std::string> default_variant() const override { return default_variant_id; }
    TriangleGroup get_triangles(const UnitConfig&, double width, double height) const override {
        return geometry::square_triangles(width, height);
    }
    ConfigSchema config_schema() const override { return {{}, {"fill"}}; }
    Thumbnail thumbnail() const override { return {"0 0 24 24", {}}; }
};

std::unique_ptr<StubUnit> stub(const std::string& id = "stub") {
    auto unit = std::make_unique<StubUnit>();
    unit->id = id;
    return unit;
}

}  // namespace

// ============================================
// Built-in registry
// ============================================

TEST(UnitRegistryTest, BuiltinTypesInRegistrationOrder) {
    const UnitRegistry& registry = builtin_registry();
    EXPECT_EQ(registry.get_type_ids(), (std::vector<std::string>{"square", "hst", "flying_geese", "qst"}));
    EXPECT_EQ(registry.size(), 4u);
    EXPECT_TRUE(registry.is_frozen());
    EXPECT_EQ(&registry, &builtin_registry());
}

TEST(UnitRegistryTest, BuiltinMetadata) {
    const UnitRegistry& registry = builtin_registry();

    const UnitDefinition& fg = registry.get_or_throw("flying_geese");
    EXPECT_EQ(fg.display_name(), "Flying Geese");
    EXPECT_EQ(fg.category(), UnitCategory::Compound);
    EXPECT_EQ(fg.placement_mode(), PlacementMode::TwoTap);
    EXPECT_FALSE(fg.supports_batch_placement());
    EXPECT_TRUE(fg.wide_in_picker());
    EXPECT_EQ(fg.default_variant(), std::optional<std::string>("right"));
    EXPECT_EQ(fg.variants().size(), 4u);

    const UnitDefinition& square = registry.get_or_throw("square");
    EXPECT_EQ(square.placement_mode(), PlacementMode::SingleTap);
    EXPECT_TRUE(square.variants().empty());
    EXPECT_FALSE(square.default_variant().has_value());

    auto compound = registry.get_by_category(UnitCategory::Compound);
    ASSERT_EQ(compound.size(), 1u);
    EXPECT_EQ(compound[0]->type_id(), "flying_geese");
    EXPECT_EQ(registry.get_by_category(UnitCategory::Basic).size(), 3u);
}

TEST(UnitRegistryTest, GetReturnsNullForUnknown) {
    EXPECT_EQ(builtin_registry().get("log_cabin"), nullptr);
    EXPECT_FALSE(builtin_registry().has("log_cabin"));
    EXPECT_TRUE(builtin_registry().has("qst"));
}

TEST(UnitRegistryTest, GetOrThrowNamesKnownTypes) {
    try {
        builtin_registry().get_or_throw("log_cabin");
        FAIL() << "expected UnknownUnitTypeError";
    } catch (const UnknownUnitTypeError& e) {
        EXPECT_EQ(e.type_id(), "log_cabin");
        EXPECT_EQ(e.known_ids().size(), 4u);
        EXPECT_EQ(std::string(e.what()),
                  "Unknown unit type: \"log_cabin\". Registered types: square, hst, flying_geese, qst");
    }
}

TEST(UnitRegistryTest, EmptyRegistryErrorSaysNone) {
    UnitRegistry registry;
    try {
        registry.get_or_throw("square");
        FAIL() << "expected UnknownUnitTypeError";
    } catch (const UnknownUnitTypeError& e) {
        EXPECT_EQ(std::string(e.what()), "Unknown unit type: \"square\". Registered types: (none)");
    }
}

// ============================================
// Registration rules
// ============================================

TEST(UnitRegistryTest, RegisterAndLookup) {
    UnitRegistry registry;
    registry.register_definition(stub("a"));
    registry.register_definition(stub("b"));

    EXPECT_EQ(registry.size(), 2u);
    ASSERT_NE(registry.get("b"), nullptr);
    EXPECT_EQ(registry.get("b")->type_id(), "b");
    EXPECT_EQ(registry.get_all().front()->type_id(), "a");
}

TEST(UnitRegistryTest, RejectsDuplicateId) {
    UnitRegistry registry;
    registry.register_definition(stub("a"));
    EXPECT_THROW(registry.register_definition(stub("a")), RegistrationError);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(UnitRegistryTest, FrozenRejectsRegistration) {
    UnitRegistry registry;
    registry.freeze();
    EXPECT_THROW(registry.register_definition(stub()), RegistrationError);

    registry.unfreeze();
    EXPECT_NO_THROW(registry.register_definition(stub()));
}

TEST(UnitRegistryTest, RejectsIncompleteDefinitions) {
    UnitRegistry registry;

    auto no_id = stub("");
    EXPECT_THROW(registry.register_definition(std::move(no_id)), RegistrationError);

    auto no_name = stub();
    no_name->name = "";
    EXPECT_THROW(registry.register_definition(std::move(no_name)), RegistrationError);

    auto no_patches = stub();
    no_patches->patch_list.clear();
    EXPECT_THROW(registry.register_definition(std::move(no_patches)), RegistrationError);

    auto no_default = stub();
    no_default->variant_list = {{"a", "A", "a"}, {"b", "B", "b"}};
    EXPECT_THROW(registry.register_definition(std::move(no_default)), RegistrationError);

    auto bad_default = stub();
    bad_default->variant_list = {{"a", "A", "a"}};
    bad_default->default_variant_id = "z";
    EXPECT_THROW(registry.register_definition(std::move(bad_default)), RegistrationError);

    EXPECT_EQ(registry.size(), 0u);
}

TEST(UnitRegistryTest, ClearUnfreezes) {
    UnitRegistry registry;
    register_builtin_units(registry);
    registry.freeze();
    registry.clear();

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.is_frozen());
    EXPECT_FALSE(registry.has("square"));
}

// ============================================
// Definitions
// ============================================

TEST(UnitDefinitionTest, FlyingGeeseSpanDependsOnVariant) {
    const UnitDefinition& fg = builtin_registry().get_or_throw("flying_geese");
    EXPECT_EQ(fg.span_for_variant("left"), (Span{1, 2}));
    EXPECT_EQ(fg.span_for_variant("right"), (Span{1, 2}));
    EXPECT_EQ(fg.span_for_variant("up"), (Span{2, 1}));
    EXPECT_EQ(fg.span_for_variant("down"), (Span{2, 1}));
    EXPECT_EQ(fg.span_for_variant(std::nullopt), fg.default_span());

    EXPECT_EQ(flying_geese_span(FlyingGeeseDirection::Down), (Span{2, 1}));
}

TEST(UnitDefinitionTest, DefaultConfigUsesDefaultRoles) {
    UnitConfig config = builtin_registry().get_or_throw("flying_geese").default_config();
    EXPECT_EQ(config.variant, std::optional<std::string>("right"));
    EXPECT_EQ(config.patch_roles.size(), 3u);
    for (const auto& [patch_id, role] : config.patch_roles) {
        EXPECT_EQ(role, "background") << patch_id;
    }
}

TEST(UnitDefinitionTest, FindPatch) {
    const UnitDefinition& qst = builtin_registry().get_or_throw("qst");
    ASSERT_NE(qst.find_patch("left"), nullptr);
    EXPECT_EQ(qst.find_patch("left")->id, "left");
    EXPECT_EQ(qst.find_patch("goose"), nullptr);
}

TEST(UnitDefinitionTest, ConfigSchemaValidation) {
    const UnitDefinition& hst = builtin_registry().get_or_throw("hst");
    ConfigSchema schema = hst.config_schema();

    UnitConfig ok{"ne", {{"primary", "feature"}, {"secondary", "background"}}};
    EXPECT_TRUE(schema.validate(ok).valid);

    UnitConfig missing_variant{std::nullopt, ok.patch_roles};
    EXPECT_FALSE(schema.validate(missing_variant).valid);

    UnitConfig bad_variant{"north", ok.patch_roles};
    ValidationResult bad = schema.validate(bad_variant);
    EXPECT_FALSE(bad.valid);
    ASSERT_EQ(bad.errors.size(), 1u);
    EXPECT_EQ(bad.errors[0], "Invalid variant \"north\"");

    UnitConfig missing_patch{"ne", {{"primary", "feature"}}};
    EXPECT_FALSE(schema.validate(missing_patch).valid);

    UnitConfig extra_patch = ok;
    extra_patch.patch_roles["goose"] = "accent1";
    ValidationResult extra = schema.validate(extra_patch);
    EXPECT_TRUE(extra.valid);
    EXPECT_EQ(extra.warnings.size(), 1u);

    ConfigSchema square = builtin_registry().get_or_throw("square").config_schema();
    EXPECT_FALSE(square.validate(UnitConfig{"nw", {{"fill", "feature"}}}).valid);
}

TEST(UnitDefinitionTest, FlyingGeesePlacementNeedsAFreeNeighbour) {
    const UnitDefinition& fg = builtin_registry().get_or_throw("flying_geese");

    auto all_free = fg.validate_placement({0, 0}, 3, [](const GridPosition&) { return false; });
    ASSERT_TRUE(all_free.has_value());
    EXPECT_TRUE(all_free->valid);
    EXPECT_EQ(all_free->valid_adjacent_cells.size(), 2u);  // Corner: down and right

    auto boxed_in = fg.validate_placement({1, 1}, 3, [](const GridPosition& cell) {
        return !(cell.row == 1 && cell.col == 1);
    });
    ASSERT_TRUE(boxed_in.has_value());
    EXPECT_FALSE(boxed_in->valid);
    EXPECT_EQ(boxed_in->reason, "No adjacent empty cells available for Flying Geese");

    const UnitDefinition& square = builtin_registry().get_or_throw("square");
    EXPECT_FALSE(square.validate_placement({0, 0}, 3, [](const GridPosition&) { return false; }).has_value());
}

TEST(UnitDefinitionTest, TrianglesFollowVariant) {
    const UnitDefinition& hst = builtin_registry().get_or_throw("hst");
    auto triangles = hst.get_triangles(UnitConfig{"se", {}}, 10, 10);
    EXPECT_EQ(triangles, geometry::hst_triangles(HstVariant::SE, 10, 10));

    EXPECT_EQ(to_string(UnitCategory::Compound), "compound");
}
