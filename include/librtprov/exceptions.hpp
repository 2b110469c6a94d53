#pragma once

#include "export.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <source_location>
#include <vector>

namespace librtprov {

class type_expr;

class LIBRTPROV_EXPORT di_error : public std::runtime_error {
public:
    explicit di_error(const std::string& message,
                      std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. commit stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    std::string full_diagnostic() const;

    /// Append resolution context to this exception.  Each enclosing
    /// descriptor creation appends its own description, so the final what()
    /// reads "... (while resolving List<String> -> Repo<String>)".
    void append_resolution_context(const std::string& component_info);

    const char* what() const noexcept override;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
    std::string resolution_context_;
    mutable std::string cached_what_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

class LIBRTPROV_EXPORT not_found : public di_error {
public:
    explicit not_found(const type_expr& type,
                       std::string_view hint = {},
                       std::source_location loc = std::source_location::current());

    const std::string& requested() const noexcept { return requested_; }

private:
    std::string requested_;
};

class LIBRTPROV_EXPORT cyclic_dependency : public di_error {
public:
    explicit cyclic_dependency(std::vector<std::string> cycle,
                               std::source_location loc = std::source_location::current());

    const std::vector<std::string>& cycle() const noexcept { return cycle_; }

private:
    std::vector<std::string> cycle_;
    static std::string build_message(const std::vector<std::string>& cycle);
};

/// A non-di_error exception escaped while constructing a component.
class LIBRTPROV_EXPORT resolution_error : public di_error {
public:
    resolution_error(std::string_view component, const std::exception& inner,
                     std::source_location loc = std::source_location::current());
};

/// Aggregates one or more failures raised by provider members.
class LIBRTPROV_EXPORT multi_error : public di_error {
public:
    explicit multi_error(std::vector<std::exception_ptr> errors,
                         std::source_location loc = std::source_location::current());

    const std::vector<std::exception_ptr>& errors() const noexcept { return errors_; }

private:
    std::vector<std::exception_ptr> errors_;
    static std::string build_message(const std::vector<std::exception_ptr>& errors);
};

/// The destroy method named by a provides marker does not exist.
class LIBRTPROV_EXPORT destroy_method_not_found : public di_error {
public:
    destroy_method_not_found(std::string_view method, std::string_view provider,
                             std::source_location loc = std::source_location::current());
};

class LIBRTPROV_EXPORT illegal_state : public di_error {
public:
    using di_error::di_error;
};

class LIBRTPROV_EXPORT unsupported_operation : public di_error {
public:
    using di_error::di_error;
};

} // namespace librtprov
