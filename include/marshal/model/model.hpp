#pragma once

/// @file model.hpp
/// @brief Main include file for marshal_model module

// Forward declarations
#include "fwd.hpp"

// Value types
#include "math.hpp"
#include "type_kind.hpp"
#include "flag_table.hpp"
#include "typed_value.hpp"

// Type system
#include "type_descriptor.hpp"
#include "type_registry.hpp"

// Object model
#include "object.hpp"
#include "object_model.hpp"
#include "asset_database.hpp"
#include "world.hpp"

/// @namespace marshal_model
/// @brief Host object model the converters target
///
/// Scenes of nodes with attached components, persisted assets, the type
/// descriptors that describe their properties and the typed values stored
/// in them.
