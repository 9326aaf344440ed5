#include <gtest/gtest.h>
#include "../TestSchema.hpp"

#include <cstdint>
#include <limits>
#include <vector>

using namespace Strata;
using Strata::Test::CodeOf;
using Strata::Test::Unwrap;

class ValidationEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        cell = Unwrap(db.DefineArchetype("Cell"));
    }

    ComponentID Define(ComponentDefinition def)
    {
        return Unwrap(db.DefineComponent(cell, def));
    }

    static constexpr float NaN = std::numeric_limits<float>::quiet_NaN();

    Database db;
    ArchetypeID cell = INVALID_ARCHETYPE;
};

// Test components without configured checks are never inspected
TEST_F(ValidationEngineTest, ChecksOffByDefault)
{
    ComponentID voltage = Define(ComponentDefinition::Attribute("voltage", DataType::Float32()));
    Pointer p = Unwrap(db.CreateEntity(cell));
    db.Set<float>(p, voltage, NaN);

    ValidationReport report = db.RunChecks();
    EXPECT_TRUE(report.IsClean());
    EXPECT_EQ(report.checkedComponents, 0u);
    EXPECT_EQ(report.checkedValues, 0u);
}

// Test an enabled NaN check reports exactly the offending row
TEST_F(ValidationEngineTest, NaNCheck)
{
    auto def = ComponentDefinition::Attribute("voltage", DataType::Float32());
    def.validation.nanCheck = true;
    ComponentID voltage = Define(def);

    ASSERT_TRUE(db.CreateEntities(cell, 10));
    db.Set<float>(Pointer(cell, 7), voltage, NaN);

    ValidationReport report = db.RunChecks();
    ASSERT_EQ(report.violations.size(), 1u);
    EXPECT_EQ(report.violations[0].component, voltage);
    EXPECT_EQ(report.violations[0].row, 7u);
    EXPECT_EQ(report.violations[0].kind, ViolationKind::NaN);
    EXPECT_EQ(report.violations[0].entry, NO_SPARSE_ENTRY);
    EXPECT_EQ(report.checkedComponents, 1u);
    EXPECT_EQ(report.checkedValues, 10u);
}

// Test bounds are inclusive and work on integer columns
TEST_F(ValidationEngineTest, BoundsCheck)
{
    auto def = ComponentDefinition::Attribute("level", DataType::Int16());
    def.validation.bounds = Bounds{0.0, 100.0};
    ComponentID level = Define(def);

    ASSERT_TRUE(db.CreateEntities(cell, 4));
    db.Set<std::int16_t>(Pointer(cell, 0), level, 0);
    db.Set<std::int16_t>(Pointer(cell, 1), level, 100);
    db.Set<std::int16_t>(Pointer(cell, 2), level, -1);
    db.Set<std::int16_t>(Pointer(cell, 3), level, 101);

    ValidationReport report = Unwrap(db.RunChecks(level));
    ASSERT_EQ(report.Count(ViolationKind::OutOfBounds), 2u);
    EXPECT_EQ(report.violations[0].row, 2u);
    EXPECT_EQ(report.violations[1].row, 3u);
}

// Test 64-bit integers are compared exactly, beyond double precision
TEST_F(ValidationEngineTest, WideIntegerBounds)
{
    constexpr std::int64_t limit = std::int64_t(1) << 53;

    auto countDef = ComponentDefinition::Attribute("count", DataType::Int64());
    countDef.validation.bounds = Bounds{0.0, 9007199254740992.0};
    ComponentID count = Define(countDef);

    auto idDef = ComponentDefinition::Attribute("id", DataType::UInt64());
    idDef.validation.bounds = Bounds{1.0, 18446744073709549568.0};
    ComponentID id = Define(idDef);

    ASSERT_TRUE(db.CreateEntities(cell, 4));
    db.Set<std::int64_t>(Pointer(cell, 0), count, limit);
    db.Set<std::int64_t>(Pointer(cell, 1), count, limit + 1);
    db.Set<std::int64_t>(Pointer(cell, 2), count, -1);
    db.Set<std::int64_t>(Pointer(cell, 3), count, std::numeric_limits<std::int64_t>::max());
    db.Set<std::uint64_t>(Pointer(cell, 0), id, 18446744073709549568ull);
    db.Set<std::uint64_t>(Pointer(cell, 1), id, 18446744073709549569ull);
    db.Set<std::uint64_t>(Pointer(cell, 2), id, 0);
    db.Set<std::uint64_t>(Pointer(cell, 3), id, 1);

    ValidationReport counts = Unwrap(db.RunChecks(count));
    ASSERT_EQ(counts.Count(ViolationKind::OutOfBounds), 3u);
    EXPECT_EQ(counts.violations[0].row, 1u);
    EXPECT_EQ(counts.violations[1].row, 2u);
    EXPECT_EQ(counts.violations[2].row, 3u);

    ValidationReport ids = Unwrap(db.RunChecks(id));
    ASSERT_EQ(ids.Count(ViolationKind::OutOfBounds), 2u);
    EXPECT_EQ(ids.violations[0].row, 1u);
    EXPECT_EQ(ids.violations[1].row, 2u);

    // Checked writes share the exact comparison
    EntityHandle handle = Unwrap(db.MakeHandle(Pointer(cell, 0)));
    EXPECT_EQ(CodeOf(db.TrySet<std::int64_t>(handle, count, limit + 1)), ErrorCode::BoundsCheckFailure);
    EXPECT_TRUE(db.TrySet<std::int64_t>(handle, count, limit));

    // Unbounded sides never trip, even at the type's extremes
    auto openDef = ComponentDefinition::Attribute("open", DataType::Int64());
    openDef.validation.bounds = Bounds{-std::numeric_limits<double>::infinity(), std::numeric_limits<double>::infinity()};
    ComponentID open = Define(openDef);
    db.Set<std::int64_t>(Pointer(cell, 0), open, std::numeric_limits<std::int64_t>::min());
    db.Set<std::int64_t>(Pointer(cell, 1), open, std::numeric_limits<std::int64_t>::max());
    EXPECT_TRUE(Unwrap(db.RunChecks(open)).IsClean());
}

// Test a NaN value is reported as NaN only, never as out of bounds
TEST_F(ValidationEngineTest, NaNTakesPrecedence)
{
    auto def = ComponentDefinition::Attribute("voltage", DataType::Float64());
    def.validation.nanCheck = true;
    def.validation.bounds = Bounds{-100.0, 100.0};
    ComponentID voltage = Define(def);

    auto boundsOnlyDef = ComponentDefinition::Attribute("current", DataType::Float64());
    boundsOnlyDef.validation.bounds = Bounds{-1.0, 1.0};
    ComponentID current = Define(boundsOnlyDef);

    Pointer p = Unwrap(db.CreateEntity(cell));
    db.Set<double>(p, voltage, std::numeric_limits<double>::quiet_NaN());
    db.Set<double>(p, current, std::numeric_limits<double>::quiet_NaN());

    ValidationReport report = db.RunChecks();
    ASSERT_EQ(report.violations.size(), 1u);
    EXPECT_EQ(report.violations[0].component, voltage);
    EXPECT_EQ(report.violations[0].kind, ViolationKind::NaN);
}

// Test the null check reports NULL pointers
TEST_F(ValidationEngineTest, NullCheck)
{
    auto def = ComponentDefinition::Attribute("neighbour", DataType::PointerTo(cell, 16));
    def.nullability = Nullability::Allowed;
    def.validation.nullCheck = true;
    ComponentID neighbour = Define(def);

    ASSERT_TRUE(db.CreateEntities(cell, 3));
    db.SetPointer(Pointer(cell, 0), neighbour, Pointer(cell, 1));
    db.SetPointer(Pointer(cell, 1), neighbour, Pointer(cell, 2));

    ValidationReport report = db.RunChecks();
    ASSERT_EQ(report.violations.size(), 1u);
    EXPECT_EQ(report.violations[0].row, 2u);
    EXPECT_EQ(report.violations[0].kind, ViolationKind::NullPointer);
}

// Test a global constant is checked once and reported without a row
TEST_F(ValidationEngineTest, GlobalConstant)
{
    auto def = ComponentDefinition::Global("temperature", DataType::Float64());
    def.validation.bounds = Bounds{0.0, 50.0};
    def.SetInitialValue(6.3);
    ComponentID temperature = Define(def);

    ASSERT_TRUE(db.CreateEntities(cell, 5));
    EXPECT_TRUE(db.RunChecks().IsClean());

    db.SetGlobal<double>(temperature, 80.0);
    ValidationReport report = db.RunChecks();
    ASSERT_EQ(report.violations.size(), 1u);
    EXPECT_EQ(report.violations[0].row, NULL_ROW);
    EXPECT_EQ(report.violations[0].kind, ViolationKind::OutOfBounds);
    EXPECT_EQ(report.checkedValues, 1u);
}

// Test sparse violations carry the owner row and the entry position
TEST_F(ValidationEngineTest, SparseValues)
{
    auto def = ComponentDefinition::Sparse("weights", cell, DataType::Float32());
    def.validation.nanCheck = true;
    def.validation.bounds = Bounds{0.0, 1.0};
    ComponentID weights = Define(def);

    auto gapsDef = ComponentDefinition::Sparse("gaps", cell);
    ComponentID gaps = Define(gapsDef);

    ASSERT_TRUE(db.CreateEntities(cell, 3));
    std::vector<std::vector<SparseEntry<float>>> rows = {
        {{1, 0.5f}},
        {{0, 0.1f}, {2, 1.5f}, {1, NaN}},
        {}
    };
    ASSERT_TRUE(db.RebuildSparse(weights, rows));
    ASSERT_TRUE(db.RebuildSparse(gaps, std::vector<std::vector<RowIndex>>{{1}, {}, {0}}));

    ValidationReport report = db.RunChecks();
    ASSERT_EQ(report.violations.size(), 2u);
    EXPECT_EQ(report.violations[0].row, 1u);
    EXPECT_EQ(report.violations[0].entry, 1u);
    EXPECT_EQ(report.violations[0].kind, ViolationKind::OutOfBounds);
    EXPECT_EQ(report.violations[1].row, 1u);
    EXPECT_EQ(report.violations[1].entry, 2u);
    EXPECT_EQ(report.violations[1].kind, ViolationKind::NaN);
    EXPECT_EQ(report.checkedValues, 4u);

    // Connectivity-only matrices have nothing to check
    EXPECT_TRUE(Unwrap(db.RunChecks(gaps)).IsClean());
}

// Test rows awaiting destruction are not validated
TEST_F(ValidationEngineTest, SkipsMarkedRows)
{
    auto def = ComponentDefinition::Attribute("voltage", DataType::Float32());
    def.validation.nanCheck = true;
    ComponentID voltage = Define(def);

    ASSERT_TRUE(db.CreateEntities(cell, 3));
    db.Set<float>(Pointer(cell, 1), voltage, NaN);
    ASSERT_TRUE(db.MarkDestroy(Pointer(cell, 1)));

    ValidationReport report = db.RunChecks();
    EXPECT_TRUE(report.IsClean());
    EXPECT_EQ(report.checkedValues, 2u);
}

// Test a scoped run looks at one component only
TEST_F(ValidationEngineTest, ScopedRun)
{
    auto aDef = ComponentDefinition::Attribute("a", DataType::Float32());
    aDef.validation.nanCheck = true;
    ComponentID a = Define(aDef);

    auto bDef = ComponentDefinition::Attribute("b", DataType::Float32());
    bDef.validation.nanCheck = true;
    ComponentID b = Define(bDef);

    Pointer p = Unwrap(db.CreateEntity(cell));
    db.Set<float>(p, a, NaN);
    db.Set<float>(p, b, NaN);

    ValidationReport scoped = Unwrap(db.RunChecks(b));
    ASSERT_EQ(scoped.violations.size(), 1u);
    EXPECT_EQ(scoped.violations[0].component, b);
    EXPECT_EQ(scoped.checkedComponents, 1u);

    EXPECT_EQ(db.RunChecks().Count(ViolationKind::NaN), 2u);
}

// Test a scoped run naming an unknown component is a schema error, not a clean report
TEST_F(ValidationEngineTest, ScopedRunUnknownComponent)
{
    auto def = ComponentDefinition::Attribute("voltage", DataType::Float32());
    def.validation.nanCheck = true;
    ComponentID voltage = Define(def);
    Pointer p = Unwrap(db.CreateEntity(cell));
    db.Set<float>(p, voltage, NaN);

    EXPECT_EQ(CodeOf(db.RunChecks(ComponentID(42))), ErrorCode::SchemaError);
    EXPECT_EQ(CodeOf(db.RunChecks(INVALID_COMPONENT)), ErrorCode::SchemaError);
    EXPECT_EQ(CodeOf(db.RunChecks(voltage + 1)), ErrorCode::SchemaError);

    EXPECT_EQ(Unwrap(db.RunChecks(voltage)).violations.size(), 1u);
}

// Test checked writes refuse values that fail the component's checks
TEST_F(ValidationEngineTest, CheckedWrites)
{
    auto def = ComponentDefinition::Attribute("voltage", DataType::Float32());
    def.validation.nanCheck = true;
    def.validation.bounds = Bounds{-100.0, 100.0};
    ComponentID voltage = Define(def);

    auto linkDef = ComponentDefinition::Attribute("link", DataType::PointerTo(cell));
    linkDef.nullability = Nullability::Allowed;
    linkDef.validation.nullCheck = true;
    ComponentID link = Define(linkDef);

    Pointer p = Unwrap(db.CreateEntity(cell));
    EntityHandle handle = Unwrap(db.MakeHandle(p));

    EXPECT_EQ(CodeOf(db.TrySet<float>(handle, voltage, NaN)), ErrorCode::NaNCheckFailure);
    EXPECT_EQ(CodeOf(db.TrySet<float>(handle, voltage, 150.0f)), ErrorCode::BoundsCheckFailure);
    ASSERT_TRUE(db.TrySet<float>(handle, voltage, -65.0f));
    EXPECT_EQ(Unwrap(db.TryGet<float>(handle, voltage)), -65.0f);

    EXPECT_EQ(CodeOf(db.TrySetPointer(handle, link, Pointer::Null(cell))), ErrorCode::NullCheckFailure);
    ASSERT_TRUE(db.TrySetPointer(handle, link, p));
    EXPECT_EQ(Unwrap(db.TryGetPointer(handle, link)), p);

    // Failures are reportable as validation errors
    Error failure = db.TrySet<float>(handle, voltage, NaN).Error();
    EXPECT_TRUE(failure.IsValidationFailure());
}
