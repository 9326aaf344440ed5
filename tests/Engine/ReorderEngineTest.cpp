#include <gtest/gtest.h>
#include "../TestSchema.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace Strata;
using Strata::Test::CodeOf;
using Strata::Test::NeuronSchema;
using Strata::Test::Unwrap;

class ReorderEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        // Voltages 5, 3, 4, 1, 2; each segment's parent is the one created before it
        std::vector<float> voltages = {5.0f, 3.0f, 4.0f, 1.0f, 2.0f};
        for (float v : voltages)
        {
            Pointer parent = segments.empty() ? Pointer() : segments.back();
            segments.push_back(schema.AddSegment(v, parent));
            handles.push_back(schema.Handle(segments.back()));
        }
        for (Pointer s : segments)
        {
            channels.push_back(schema.Handle(schema.AddChannel(s, 0.0f)));
        }
    }

    float VoltageOf(const EntityHandle& handle)
    {
        return schema.db.Get<float>(schema.Resolve(handle), schema.voltage);
    }

    NeuronSchema schema;
    std::vector<Pointer> segments;
    std::vector<EntityHandle> handles;
    std::vector<EntityHandle> channels;
};

// Test reordering sorts rows and keeps each entity's values with it
TEST_F(ReorderEngineTest, SortsByKey)
{
    const NeuronSchema& view = schema;
    ASSERT_TRUE(schema.db.Reorder(schema.segment, [&](RowIndex row)
    {
        return view.db.Get<float>(Pointer(view.segment, row), view.voltage);
    }));

    auto voltages = schema.db.GetColumnData<float>(schema.voltage);
    std::vector<float> sorted(voltages.begin(), voltages.end());
    EXPECT_EQ(sorted, (std::vector<float>{1.0f, 2.0f, 3.0f, 4.0f, 5.0f}));
    EXPECT_EQ(schema.db.Size(schema.segment), 5u);

    std::vector<float> expected = {5.0f, 3.0f, 4.0f, 1.0f, 2.0f};
    for (std::size_t i = 0; i < handles.size(); ++i)
    {
        EXPECT_EQ(VoltageOf(handles[i]), expected[i]);
    }
}

// Test pointers into the reordered archetype still name the same entities
TEST_F(ReorderEngineTest, RewritesPointers)
{
    std::uint64_t epoch = schema.db.GetEpoch(schema.segment);
    ASSERT_TRUE(schema.db.ReorderBy(schema.segment, schema.voltage));
    EXPECT_EQ(schema.db.GetEpoch(schema.segment), epoch + 1);

    for (std::size_t i = 0; i < handles.size(); ++i)
    {
        Pointer self = schema.Resolve(handles[i]);
        Pointer parent = schema.db.GetPointer(self, schema.parent);
        if (i == 0)
        {
            EXPECT_TRUE(parent.IsNull());
        }
        else
        {
            EXPECT_EQ(parent, schema.Resolve(handles[i - 1]));
        }

        Pointer channel = schema.Resolve(channels[i]);
        EXPECT_EQ(schema.db.GetPointer(channel, schema.location), self);
    }

    // Channels were not moved
    for (std::size_t i = 0; i < channels.size(); ++i)
    {
        EXPECT_EQ(schema.Resolve(channels[i]).row, static_cast<RowIndex>(i));
    }
}

// Test sorting by a pointer groups owners by target row with NULL last
TEST_F(ReorderEngineTest, ReorderByPointer)
{
    NeuronSchema local(Nullability::Allowed);
    Pointer root = local.AddSegment(0.0f);
    Pointer other = local.AddSegment(1.0f);
    local.AddSegment(2.0f);
    local.AddSegment(3.0f, other);
    local.AddSegment(4.0f, root);

    ASSERT_TRUE(local.db.ReorderBy(local.segment, local.parent));

    // NULL parents (0, 1, 2) last in their original order, children by parent row
    std::vector<float> expected = {4.0f, 3.0f, 0.0f, 1.0f, 2.0f};
    auto voltages = local.db.GetColumnData<float>(local.voltage);
    ASSERT_EQ(voltages.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i)
    {
        EXPECT_EQ(voltages[i], expected[i]);
    }

    // The child of the old row 0 now points at the new row of that segment
    EXPECT_EQ(local.db.GetPointer(Pointer(local.segment, 0), local.parent), Pointer(local.segment, 2));
    EXPECT_EQ(local.db.GetPointer(Pointer(local.segment, 1), local.parent), Pointer(local.segment, 3));
}

// Test NaN keys sort after every number
TEST_F(ReorderEngineTest, NaNSortsLast)
{
    schema.db.Set<float>(segments[3], schema.voltage, std::numeric_limits<float>::quiet_NaN());
    ASSERT_TRUE(schema.db.ReorderBy(schema.segment, schema.voltage));

    auto voltages = schema.db.GetColumnData<float>(schema.voltage);
    EXPECT_EQ(voltages[0], 2.0f);
    EXPECT_EQ(voltages[3], 5.0f);
    EXPECT_TRUE(std::isnan(voltages[4]));
}

// Test explicit permutations are validated before anything moves
TEST_F(ReorderEngineTest, PermuteValidatesOrder)
{
    std::vector<RowIndex> tooShort = {0, 1, 2};
    std::vector<RowIndex> duplicate = {0, 1, 1, 3, 4};
    std::vector<RowIndex> outOfRange = {0, 1, 2, 3, 5};

    EXPECT_EQ(CodeOf(schema.db.Permute(schema.segment, tooShort)), ErrorCode::DataError);
    EXPECT_EQ(CodeOf(schema.db.Permute(schema.segment, duplicate)), ErrorCode::DataError);
    EXPECT_EQ(CodeOf(schema.db.Permute(schema.segment, outOfRange)), ErrorCode::DataError);
    EXPECT_EQ(CodeOf(schema.db.Permute(42, tooShort)), ErrorCode::SchemaError);

    EXPECT_EQ(schema.Resolve(handles[0]).row, 0u);

    std::vector<RowIndex> reversed = {4, 3, 2, 1, 0};
    ASSERT_TRUE(schema.db.Permute(schema.segment, reversed));
    EXPECT_EQ(schema.Resolve(handles[0]).row, 4u);
    EXPECT_EQ(schema.db.Get<float>(Pointer(schema.segment, 0), schema.voltage), 2.0f);
}

// Test marks follow their entities through a reorder
TEST_F(ReorderEngineTest, MarksTravelWithRows)
{
    ASSERT_TRUE(handles[4].Destroy());
    std::vector<RowIndex> reversed = {4, 3, 2, 1, 0};
    ASSERT_TRUE(schema.db.Permute(schema.segment, reversed));

    EXPECT_TRUE(schema.db.IsMarked(Pointer(schema.segment, 0)));
    EXPECT_FALSE(schema.db.IsMarked(Pointer(schema.segment, 4)));
    EXPECT_EQ(schema.db.MarkedCount(schema.segment), 1u);

    schema.db.Commit();
    EXPECT_FALSE(handles[4].IsValid());
    EXPECT_FALSE(channels[4].IsValid());
    EXPECT_EQ(VoltageOf(handles[3]), 1.0f);
}

// Test sparse rows of the reordered archetype and sparse targets into it both follow
TEST_F(ReorderEngineTest, SparseFollowsPermutation)
{
    Database db;
    ArchetypeID neuron = Unwrap(db.DefineArchetype("Neuron"));
    ComponentID synapses = Unwrap(db.DefineComponent(neuron, ComponentDefinition::Sparse("synapses", neuron, DataType::Float32())));
    ComponentID id = Unwrap(db.DefineComponent(neuron, ComponentDefinition::Attribute("id", DataType::Int32())));

    ASSERT_TRUE(db.CreateEntities(neuron, 3));
    for (RowIndex row = 0; row < 3; ++row)
    {
        db.Set<std::int32_t>(Pointer(neuron, row), id, static_cast<std::int32_t>(row));
    }

    // 0 -> 1 (0.5), 2 -> 0 (1.5)
    std::vector<std::vector<SparseEntry<float>>> rows = {{{1, 0.5f}}, {}, {{0, 1.5f}}};
    ASSERT_TRUE(db.RebuildSparse(synapses, rows));

    // New row k takes old row order[k]: old 0 -> 2, old 1 -> 0, old 2 -> 1
    std::vector<RowIndex> order = {1, 2, 0};
    ASSERT_TRUE(db.Permute(neuron, order));

    EXPECT_EQ(db.Get<std::int32_t>(Pointer(neuron, 2), id), 0);

    SparseRowView fromOld0 = db.GetSparseRow(Pointer(neuron, 2), synapses);
    ASSERT_EQ(fromOld0.Size(), 1u);
    EXPECT_EQ(fromOld0.Target(0), 0u);
    EXPECT_EQ(fromOld0.Value<float>(0), 0.5f);

    SparseRowView fromOld2 = db.GetSparseRow(Pointer(neuron, 1), synapses);
    ASSERT_EQ(fromOld2.Size(), 1u);
    EXPECT_EQ(fromOld2.Target(0), 2u);
    EXPECT_EQ(fromOld2.Value<float>(0), 1.5f);

    EXPECT_TRUE(db.GetSparseRow(Pointer(neuron, 0), synapses).Empty());
}

// Test sort keys must be numeric or pointer attributes of the archetype
TEST_F(ReorderEngineTest, ReorderByRejectsUnsortableKeys)
{
    Database db;
    ArchetypeID cell = Unwrap(db.DefineArchetype("Cell"));
    ArchetypeID other = Unwrap(db.DefineArchetype("Other"));
    ComponentID blob = Unwrap(db.DefineComponent(cell, ComponentDefinition::Attribute("blob", DataType::Opaque(12))));
    ComponentID links = Unwrap(db.DefineComponent(cell, ComponentDefinition::Sparse("links", cell)));
    ComponentID scale = Unwrap(db.DefineComponent(cell, ComponentDefinition::Global("scale", DataType::Float64())));
    ComponentID weight = Unwrap(db.DefineComponent(other, ComponentDefinition::Attribute("weight", DataType::Float32())));

    EXPECT_EQ(CodeOf(db.ReorderBy(cell, blob)), ErrorCode::TypeMismatch);
    EXPECT_EQ(CodeOf(db.ReorderBy(cell, links)), ErrorCode::TypeMismatch);
    EXPECT_EQ(CodeOf(db.ReorderBy(cell, scale)), ErrorCode::TypeMismatch);
    EXPECT_EQ(CodeOf(db.ReorderBy(cell, weight)), ErrorCode::SchemaError);
    EXPECT_EQ(CodeOf(db.ReorderBy(99, weight)), ErrorCode::SchemaError);
}
