#pragma once

// Strata - archetype-based structure-of-arrays storage for large simulations
// This header includes all Strata headers in dependency order

// Core
#include "Platform/Platform.hpp"
#include "Core/Base.hpp"
#include "Core/Config.hpp"
#include "Core/Error.hpp"
#include "Core/Result.hpp"
#include "Core/Memory.hpp"
#include "Core/Profile.hpp"

// Schema
#include "Entity/Pointer.hpp"
#include "Schema/DataType.hpp"
#include "Schema/ComponentDescriptor.hpp"
#include "Schema/SchemaRegistry.hpp"

// Storage
#include "Storage/Column.hpp"
#include "Storage/GlobalConstant.hpp"
#include "Storage/SparseMatrixColumn.hpp"
#include "Storage/ComponentStorage.hpp"

// Entities
#include "Entity/PointerIndex.hpp"
#include "Archetype/EntityTable.hpp"
#include "Entity/EntityHandle.hpp"

// Engines
#include "Engine/ReferenceRewriter.hpp"
#include "Engine/CompactionEngine.hpp"
#include "Engine/ReorderEngine.hpp"
#include "Engine/ValidationEngine.hpp"

// Facade
#include "Database/Database.hpp"
