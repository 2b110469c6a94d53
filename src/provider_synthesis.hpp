#pragma once

// Internal helpers shared by the discovery engines and the locator.
// Not installed.

#include "librtprov/class_info.hpp"
#include "librtprov/descriptor.hpp"
#include "librtprov/type.hpp"

#include <string>
#include <vector>

namespace librtprov {
class service_locator;
}

namespace librtprov::internal {

/// The raw class carries `contract`, or an annotation whose class carries
/// `contract_indicator`.
bool is_contract(const type_expr& type);

/// Contracts a type advertises on its own: the `contracts_provided` list of
/// its raw class, else the type plus every contract supertype.  An opaque
/// type advertises only itself.
std::vector<type_expr> advertised_contracts(const type_expr& type);

const annotation_list& annotations_of(const member_ref& member) noexcept;

bool is_static_member(const member_ref& member) noexcept;

/// A provides_descriptor standing in for a class that cannot be built.
/// Only its static members are worth scanning.
bool is_placeholder(const active_descriptor& descriptor) noexcept;

/// "Declaring.name()" for methods, "Declaring.name" for fields.
std::string member_name(const member_ref& member);

struct synthesis_options {
    bool dispose_field_values = false;
};

/// Synthesize the descriptor for one member of `provider_class`, seen
/// through `provider_type`.
///
/// Returns null when the member carries no provides marker, or when its
/// produced type or a parameter type still mentions a type variable after
/// resolution.  `provider` is the active descriptor of the owning
/// component and is required for instance members.
descriptor_ptr descriptor_from_member(service_locator& locator,
                                      const member_ref& member,
                                      const class_info& provider_class,
                                      const type_expr& provider_type,
                                      const descriptor_ptr& provider,
                                      const synthesis_options& options);

} // namespace librtprov::internal
