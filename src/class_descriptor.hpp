#pragma once

// Descriptor for a class built through its constructor.  Not installed.

#include "librtprov/class_info.hpp"
#include "librtprov/descriptor.hpp"
#include "librtprov/type.hpp"

#include <optional>
#include <string>
#include <vector>

namespace librtprov {
class service_locator;
}

namespace librtprov::internal {

/// The constructor marked `inject`, else the zero-argument one, else null.
const constructor_info* usable_constructor(const class_info& cls) noexcept;

/// Whether a class descriptor for `cls` could build instances.
bool is_instantiable(const class_info& cls) noexcept;

class class_descriptor final : public active_descriptor {
public:
    /// Throws di_error if the raw class of `type` cannot be instantiated.
    class_descriptor(service_locator& locator, type_expr type);

    const class_info* implementation_class() const noexcept override { return cls_; }
    const type_expr& implementation_type() const noexcept override { return type_; }
    const std::vector<type_expr>& contract_types() const noexcept override { return contracts_; }
    const annotation_ptr& scope_annotation() const noexcept override { return scope_; }
    const annotation_list& qualifier_annotations() const noexcept override { return qualifiers_; }
    std::optional<std::string> name() const override;
    std::optional<bool> is_proxiable() const override;
    std::optional<bool> is_proxy_for_same_scope() const override;

    instance_ptr create(service_handle& root) override;
    void dispose(const instance_ptr& instance) override;
    std::string to_string() const override;

protected:
    int initial_ranking() const override;

private:
    service_locator* locator_;
    type_expr type_;
    const class_info* cls_;
    const constructor_info* constructor_;
    std::vector<type_expr> contracts_;
    annotation_ptr scope_;
    annotation_list qualifiers_;
};

} // namespace librtprov::internal
