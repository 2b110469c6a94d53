#pragma once

/// @file fwd.hpp
/// Forward declarations for all public librtprov symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

namespace librtprov {

// type.hpp
enum class type_kind;
class type_expr;

// class_info.hpp
enum class class_kind;
enum class provider_kind;
class type_parameter;
struct parameter_info;
struct method_info;
struct field_info;
struct constructor_info;
struct supertype_info;
class class_info;

// annotations.hpp
class annotation;
class rank_annotation;
class named_annotation;
class provides_annotation;
class contracts_provided_annotation;
class registers_annotation;

// descriptor.hpp
class active_descriptor;

// provides_descriptor.hpp
class provides_descriptor;

// configuration.hpp
class dynamic_configuration;
class dynamic_configuration_service;
class configuration_listener;

// service_handle.hpp
class service_handle;

// service_locator.hpp, locator.hpp
class service_locator;
struct locator_options;
class locator;

// exceptions.hpp
class di_error;
class not_found;
class cyclic_dependency;
class resolution_error;
class multi_error;
class destroy_method_not_found;
class illegal_state;
class unsupported_operation;

// providers_seen.hpp, provides_listener.hpp, provides_enabler.hpp
class providers_seen;
struct discovery_options;
class provides_listener;
struct enabler_options;
class provides_enabler;

} // namespace librtprov
