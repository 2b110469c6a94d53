#pragma once

/// @file provides_descriptor.hpp
/// Descriptor synthesized for one provider member.

#include "export.hpp"
#include "class_info.hpp"
#include "descriptor.hpp"
#include "type.hpp"

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace librtprov {

/// The element a provides_descriptor was built from.  A class source marks
/// a placeholder for a class that cannot be instantiated.
using provider_source = std::variant<const method_info*, const field_info*, const class_info*>;

using create_fn  = std::function<instance_ptr(service_handle& root)>;
using dispose_fn = std::function<void(const instance_ptr& instance)>;

class LIBRTPROV_EXPORT provides_descriptor final : public active_descriptor {
public:
    provides_descriptor(provider_source source,
                        type_expr implementation_type,
                        std::vector<type_expr> contracts,
                        annotation_ptr scope,
                        create_fn create,
                        dispose_fn dispose);

    const provider_source& source() const noexcept { return source_; }

    const class_info* implementation_class() const noexcept override { return implementation_class_; }
    const type_expr& implementation_type() const noexcept override { return implementation_type_; }
    const std::vector<type_expr>& contract_types() const noexcept override { return contracts_; }
    const annotation_ptr& scope_annotation() const noexcept override { return scope_; }
    const annotation_list& qualifier_annotations() const noexcept override { return qualifiers_; }
    std::optional<std::string> name() const override;
    std::optional<bool> is_proxiable() const override;
    std::optional<bool> is_proxy_for_same_scope() const override;

    instance_ptr create(service_handle& root) override;
    void dispose(const instance_ptr& instance) override;

    /// "provides_descriptor[Repo.list]"
    std::string to_string() const override;

protected:
    int initial_ranking() const override;

private:
    const annotation_list& source_annotations() const noexcept;

    provider_source source_;
    type_expr implementation_type_;
    const class_info* implementation_class_;
    std::vector<type_expr> contracts_;
    annotation_ptr scope_;
    annotation_list qualifiers_;
    create_fn create_;
    dispose_fn dispose_;
};

} // namespace librtprov
