#pragma once

// Strata - in-memory entity/component data engine
// Includes every public header in dependency order

// Core
#include "Core/Platform.hpp"
#include "Core/Base.hpp"
#include "Core/Config.hpp"
#include "Core/Error.hpp"
#include "Core/Result.hpp"
#include "Core/Log.hpp"
#include "Core/Contract.hpp"
#include "Core/Profile.hpp"
#include "Core/TypeID.hpp"
#include "Core/Tick.hpp"

// Containers
#include "Container/Bitmap.hpp"

// Entities
#include "Entity/Entity.hpp"
#include "Entity/EntityTable.hpp"
#include "Entity/EntityAllocator.hpp"

// Components and resources
#include "Component/Component.hpp"
#include "Component/ComponentRegistry.hpp"
#include "Component/RequiredComponents.hpp"

// Storage
#include "Storage/Column.hpp"
#include "Storage/Table.hpp"
#include "Storage/SparseSet.hpp"
#include "Storage/ResourceStorage.hpp"

// Archetypes
#include "Archetype/ArchetypeEdgeStorage.hpp"
#include "Archetype/Archetype.hpp"
#include "Archetype/ArchetypeRegistry.hpp"

// Access tracking
#include "Access/AccessMode.hpp"
#include "Access/ClaimSet.hpp"

// World and queries
#include "World/WorldData.hpp"
#include "Query/QueryTerms.hpp"
#include "Query/QueryState.hpp"
#include "Query/Query.hpp"
#include "World/World.hpp"
#include "Access/WorldAccess.hpp"

// Deferred commands
#include "Commands/CommandBuffer.hpp"

// System parameters
#include "System/SystemParam.hpp"
