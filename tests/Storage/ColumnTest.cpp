#include <gtest/gtest.h>
#include "Strata/Storage/Column.hpp"
#include "Strata/Storage/GlobalConstant.hpp"

#include <cstdint>
#include <cstring>
#include <vector>

using namespace Strata;

namespace
{
    template<typename T>
    std::vector<std::byte> Bytes(const T& value)
    {
        std::vector<std::byte> bytes(sizeof(T));
        std::memcpy(bytes.data(), &value, sizeof(T));
        return bytes;
    }

    Column MakeIntColumn(std::size_t rows)
    {
        Column column(sizeof(std::int32_t), Bytes(std::int32_t(0)));
        EXPECT_TRUE(column.Append(rows));
        for (std::size_t i = 0; i < rows; ++i)
        {
            column.Set<std::int32_t>(static_cast<RowIndex>(i), static_cast<std::int32_t>(i * 10));
        }
        return column;
    }
}

class ColumnTest : public ::testing::Test
{
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// Test appended rows receive the initial value
TEST_F(ColumnTest, AppendFillsInitialValue)
{
    Column column(sizeof(float), Bytes(-65.0f));
    EXPECT_EQ(column.Size(), 0u);

    ASSERT_TRUE(column.Append(3));
    EXPECT_EQ(column.Size(), 3u);
    EXPECT_GE(column.Capacity(), 3u);
    for (RowIndex row = 0; row < 3; ++row)
    {
        EXPECT_EQ(column.Get<float>(row), -65.0f);
    }

    column.Set<float>(1, 12.5f);
    EXPECT_EQ(column.Get<float>(1), 12.5f);
    EXPECT_EQ(column.Get<float>(0), -65.0f);
}

// Test growth preserves existing contents and alignment
TEST_F(ColumnTest, GrowthPreservesData)
{
    Column column = MakeIntColumn(10);
    ASSERT_TRUE(column.Append(5000));
    EXPECT_EQ(column.Size(), 5010u);

    for (RowIndex row = 0; row < 10; ++row)
    {
        EXPECT_EQ(column.Get<std::int32_t>(row), static_cast<std::int32_t>(row * 10));
    }
    EXPECT_EQ(column.Get<std::int32_t>(5009), 0);

    auto data = column.Data<std::int32_t>();
    EXPECT_EQ(data.size(), 5010u);
    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(data.data()) % config::COLUMN_ALIGNMENT, 0u);
}

// Test reserve grows capacity without changing size
TEST_F(ColumnTest, Reserve)
{
    Column column = MakeIntColumn(4);
    ASSERT_TRUE(column.Reserve(1000));
    EXPECT_EQ(column.Size(), 4u);
    EXPECT_GE(column.Capacity(), 1000u);
    EXPECT_EQ(column.Get<std::int32_t>(3), 30);
}

// Test stable compaction keeps survivors in order
TEST_F(ColumnTest, CompactIsStable)
{
    Column column = MakeIntColumn(6);

    // Drop rows 1 and 4
    std::vector<RowIndex> remap = {0, NULL_ROW, 1, 2, NULL_ROW, 3};
    column.Compact(remap, 4);

    ASSERT_EQ(column.Size(), 4u);
    EXPECT_EQ(column.Get<std::int32_t>(0), 0);
    EXPECT_EQ(column.Get<std::int32_t>(1), 20);
    EXPECT_EQ(column.Get<std::int32_t>(2), 30);
    EXPECT_EQ(column.Get<std::int32_t>(3), 50);
}

// Test permutation with several cycles
TEST_F(ColumnTest, PermuteGathers)
{
    Column column = MakeIntColumn(6);

    // new row k takes old row order[k]: cycles (0 2 4), (1 5), fixed 3
    std::vector<RowIndex> order = {2, 5, 4, 3, 0, 1};
    column.Permute(order);

    std::vector<std::int32_t> expected = {20, 50, 40, 30, 0, 10};
    for (RowIndex row = 0; row < 6; ++row)
    {
        EXPECT_EQ(column.Get<std::int32_t>(row), expected[row]);
    }
}

// Test pointer columns map the width's all-ones value to NULL_ROW
TEST_F(ColumnTest, NarrowPointerEncoding)
{
    std::vector<std::byte> nullInit(2);
    StoreRowIndex(nullInit.data(), 2, NULL_ROW);

    Column column(2, nullInit);
    ASSERT_TRUE(column.Append(3));

    EXPECT_EQ(column.GetRow(0), NULL_ROW);
    EXPECT_EQ(column.Get<std::uint16_t>(0), 0xFFFFu);

    column.SetRow(1, 65534);
    EXPECT_EQ(column.GetRow(1), 65534u);

    column.SetRow(2, 7);
    column.SetRow(2, NULL_ROW);
    EXPECT_EQ(column.GetRow(2), NULL_ROW);
}

// Test opaque payloads round through raw bytes
TEST_F(ColumnTest, OpaquePayload)
{
    struct Gate
    {
        float m;
        float h;
        std::int32_t state;
    };

    Column column(sizeof(Gate), std::vector<std::byte>(sizeof(Gate)));
    ASSERT_TRUE(column.Append(2));

    column.Set<Gate>(1, Gate{0.25f, 0.75f, 3});
    const Gate& gate = column.Get<Gate>(1);
    EXPECT_EQ(gate.m, 0.25f);
    EXPECT_EQ(gate.h, 0.75f);
    EXPECT_EQ(gate.state, 3);

    Gate copy;
    std::memcpy(&copy, column.GetBytes(1), sizeof(Gate));
    EXPECT_EQ(copy.state, 3);
    EXPECT_EQ(column.Get<Gate>(0).state, 0);
}

class GlobalConstantTest : public ::testing::Test
{
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// Test a global constant holds one value regardless of rows
TEST_F(GlobalConstantTest, GetSet)
{
    GlobalConstant temperature(Bytes(6.3));
    EXPECT_EQ(temperature.ElementSize(), sizeof(double));
    EXPECT_EQ(temperature.Get<double>(), 6.3);

    temperature.Set(37.0);
    EXPECT_EQ(temperature.Get<double>(), 37.0);
    EXPECT_EQ(temperature.Bytes().size(), sizeof(double));
}
