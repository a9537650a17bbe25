#pragma once

/// @file value_all.hpp
/// @brief Main include file for marshal_value module

#include "fwd.hpp"
#include "value.hpp"
#include "json.hpp"
