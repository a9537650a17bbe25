#pragma once

/// @file convert.hpp
/// @brief Main include header for marshal_convert

#include "fwd.hpp"
#include "converter.hpp"
#include "context.hpp"
#include "config.hpp"
#include "constants.hpp"
#include "primitive_converter.hpp"
#include "enum_converter.hpp"
#include "struct_converter.hpp"
#include "mask_converter.hpp"
#include "reference_converter.hpp"
#include "collection_converter.hpp"
#include "composite_converter.hpp"
#include "conversion_manager.hpp"
#include "property_applier.hpp"
