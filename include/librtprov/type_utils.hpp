#pragma once

/// @file type_utils.hpp
/// Type algebra over `type_expr`: variable detection, resolution with
/// capture conversion, supertype walks and assignability.

#include "export.hpp"
#include "type.hpp"

#include <vector>

namespace librtprov {

class class_info;

/// True if `type` mentions a type variable anywhere, including wildcard
/// bounds, owners and array components.  Capture variables count.
LIBRTPROV_EXPORT bool contains_type_variable(const type_expr& type);

/// Resolve `dependent` (a type written inside some generic class) as seen
/// from `context` (a type of that class or one of its subclasses).
///
/// Wildcards in `context` are capture-converted first, each becoming a fresh
/// capture variable bounded by the wildcard's upper bounds and the declared
/// bounds of the parameter it fills.  Captures are numbered from 1 within
/// one call; two calls never produce equal captures.  Variables that the
/// context does not bind are left in place.
///
///     resolve_type(repo<String>, List<T>)          == List<String>
///     resolve_type(box<? extends Number>, T)       == capture#1 of ? extends Number
LIBRTPROV_EXPORT type_expr resolve_type(const type_expr& context, const type_expr& dependent);

/// Class of a raw or parameterized type, nullptr for every other kind.
LIBRTPROV_EXPORT const class_info* raw_class(const type_expr& type) noexcept;

/// `type` followed by every generic superclass and interface reachable from
/// it, with arguments substituted, deduplicated, breadth-first.  Supertypes
/// of a raw reference to a generic class are erased to raw classes.
LIBRTPROV_EXPORT std::vector<type_expr> supertypes_of(const type_expr& type);

/// Whether a value of type `from` may be passed where `to` is expected.
/// Raw classes must be related by inheritance; type arguments of `to` must
/// contain the corresponding arguments of `from` (wildcards by their bounds,
/// everything else by equality).  A raw `to` accepts any parameterization.
LIBRTPROV_EXPORT bool is_assignable(const type_expr& to, const type_expr& from);

} // namespace librtprov
