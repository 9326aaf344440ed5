#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

#include "../Archetype/EntityTable.hpp"
#include "../Core/Base.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "../Schema/SchemaRegistry.hpp"

namespace Strata
{
    enum class ViolationKind : std::uint8_t
    {
        NaN,
        OutOfBounds,
        NullPointer
    };

    inline constexpr std::size_t NO_SPARSE_ENTRY = std::numeric_limits<std::size_t>::max();

    struct Violation
    {
        ComponentID component = INVALID_COMPONENT;
        RowIndex row = NULL_ROW;                    // NULL_ROW for a global constant
        ViolationKind kind = ViolationKind::NaN;
        std::size_t entry = NO_SPARSE_ENTRY;        // position inside the sparse row
    };

    struct ValidationReport
    {
        std::vector<Violation> violations;
        std::size_t checkedComponents = 0;
        std::size_t checkedValues = 0;

        STRATA_NODISCARD bool IsClean() const noexcept { return violations.empty(); }

        STRATA_NODISCARD std::size_t Count(ViolationKind kind) const noexcept
        {
            return static_cast<std::size_t>(std::count_if(violations.begin(), violations.end(),
                [kind](const Violation& v) { return v.kind == kind; }));
        }
    };

    /**
    * Runs the reporting-only checks configured on components. Never modifies
    * data; violations are reported, not raised. Only a scoped run naming an
    * unknown component fails. Components with no checks configured cost nothing.
    * Rows marked for destruction are skipped.
    */
    class ValidationEngine
    {
    public:
        ValidationEngine(const SchemaRegistry& schema, const TableList& tables) noexcept :
            m_schema(schema),
            m_tables(tables)
        {}

        Result<ValidationReport> Run(ComponentID component) const
        {
            const ComponentDescriptor* desc = m_schema.GetComponent(component);
            if (!desc) STRATA_UNLIKELY
                return Err(ErrorCode::SchemaError, "Unknown component");

            ValidationReport report;
            Check(*desc, report);
            return report;
        }

        ValidationReport RunAll() const
        {
            STRATA_PROFILE_ZONE_NAMED("ValidationEngine::RunAll");

            ValidationReport report;
            for (const ComponentDescriptor& desc : m_schema.GetComponents())
            {
                Check(desc, report);
            }

            STRATA_PROFILE_PLOT("Strata/Violations", static_cast<std::int64_t>(report.violations.size()));
            if (!report.IsClean())
            {
                STRATA_PROFILE_MESSAGE_LITERAL("Validation found violations");
            }
            return report;
        }

        // Value-level check used by the checked write path. `value` holds one element of desc's type.
        STRATA_NODISCARD static Result<void> CheckValue(const ComponentDescriptor& desc, const std::byte* value)
        {
            ViolationKind kind = ViolationKind::NaN;
            if (FindViolation(desc, value, kind))
                return Err(kind == ViolationKind::NaN ? ErrorCode::NaNCheckFailure : ErrorCode::BoundsCheckFailure);
            return OK;
        }

        STRATA_NODISCARD static Result<void> CheckPointer(const ComponentDescriptor& desc, RowIndex row)
        {
            if (desc.validation.nullCheck && row == NULL_ROW)
                return Err(ErrorCode::NullCheckFailure);
            return OK;
        }

    private:
        void Check(const ComponentDescriptor& desc, ValidationReport& report) const
        {
            if (!desc.validation.Any())
                return;

            ++report.checkedComponents;
            const EntityTable& table = *m_tables[desc.archetype];

            switch (desc.storage)
            {
                case StorageKind::Attribute:
                    CheckColumn(desc, table, report);
                    break;

                case StorageKind::GlobalConstant:
                {
                    const auto& constant = table.Get<GlobalConstant>(desc.slot);
                    ++report.checkedValues;
                    Report(desc, constant.Bytes().data(), NULL_ROW, NO_SPARSE_ENTRY, report);
                    break;
                }

                case StorageKind::SparseMatrix:
                    CheckSparse(desc, table, report);
                    break;
            }
        }

        static void CheckColumn(const ComponentDescriptor& desc, const EntityTable& table, ValidationReport& report)
        {
            const Column& column = table.Get<Column>(desc.slot);

            if (desc.type.IsPointer())
            {
                if (!desc.validation.nullCheck)
                    return;
                table.ForEachLive([&](RowIndex row)
                {
                    ++report.checkedValues;
                    if (column.GetRow(row) == NULL_ROW)
                        report.violations.push_back({desc.id, row, ViolationKind::NullPointer, NO_SPARSE_ENTRY});
                });
                return;
            }

            table.ForEachLive([&](RowIndex row)
            {
                ++report.checkedValues;
                Report(desc, column.GetBytes(row), row, NO_SPARSE_ENTRY, report);
            });
        }

        static void CheckSparse(const ComponentDescriptor& desc, const EntityTable& table, ValidationReport& report)
        {
            const auto& matrix = table.Get<SparseMatrixColumn>(desc.slot);
            if (matrix.ValueSize() == 0)
                return;

            table.ForEachLive([&](RowIndex row)
            {
                SparseRowView entries = matrix.Row(row);
                for (std::size_t k = 0; k < entries.Size(); ++k)
                {
                    ++report.checkedValues;
                    Report(desc, entries.ValueBytes(k), row, k, report);
                }
            });
        }

        static void Report(const ComponentDescriptor& desc, const std::byte* value, RowIndex row, std::size_t entry, ValidationReport& report)
        {
            ViolationKind kind = ViolationKind::NaN;
            if (FindViolation(desc, value, kind))
                report.violations.push_back({desc.id, row, kind, entry});
        }

        // NaN takes precedence; a NaN value is never reported as out of bounds.
        static bool FindViolation(const ComponentDescriptor& desc, const std::byte* value, ViolationKind& kind)
        {
            const ValidationConfig& checks = desc.validation;
            if (!desc.type.IsNumeric() || (!checks.nanCheck && !checks.bounds))
                return false;

            // 64-bit integers do not survive the trip through double.
            if (desc.type.kind == TypeKind::Int64 || desc.type.kind == TypeKind::UInt64)
            {
                bool outside = desc.type.kind == TypeKind::Int64
                    ? OutsideBounds(Detail::LoadUnaligned<std::int64_t>(value), checks.bounds)
                    : OutsideBounds(Detail::LoadUnaligned<std::uint64_t>(value), checks.bounds);
                if (outside)
                    kind = ViolationKind::OutOfBounds;
                return outside;
            }

            double v = LoadAsDouble(value, desc.type.kind);
            if (std::isnan(v))
            {
                kind = ViolationKind::NaN;
                return checks.nanCheck;
            }
            if (checks.bounds && (v < checks.bounds->min || v > checks.bounds->max))
            {
                kind = ViolationKind::OutOfBounds;
                return true;
            }
            return false;
        }

        // Exact integer test against double bounds: an integer is below `min` iff it is below ceil(min).
        template<typename I>
        static bool OutsideBounds(I value, const std::optional<Bounds>& bounds) noexcept
        {
            if (!bounds)
                return false;

            const double lowest = static_cast<double>(std::numeric_limits<I>::lowest());
            const double limit = std::ldexp(1.0, std::numeric_limits<I>::digits);

            bool below = false;
            if (bounds->min >= limit)
                below = true;
            else if (bounds->min > lowest)
                below = value < static_cast<I>(std::ceil(bounds->min));

            bool above = false;
            if (bounds->max < lowest)
                above = true;
            else if (bounds->max < limit)
                above = value > static_cast<I>(std::floor(bounds->max));

            return below || above;
        }

        const SchemaRegistry& m_schema;
        const TableList& m_tables;
    };
}
