#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for marshal_convert

namespace marshal_convert {

// Converters
class ValueConverter;
class PrimitiveConverter;
class EnumConverter;
class StructConverter;
class MaskConverter;
class ReferenceConverter;
class CollectionConverter;
class CompositeConverter;

// Dispatch
class ConversionContext;
class ConversionManager;
struct ConversionFailure;
struct ConversionResult;

// Configuration
struct ConverterConfig;
class ConfigLoader;

// Property application
class PropertyApplier;
struct PropertyApplyResult;

} // namespace marshal_convert
