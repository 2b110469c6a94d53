#include "librtprov/exceptions.hpp"
#include "librtprov/type.hpp"

#include <string>
#include <utility>

namespace librtprov {

std::string di_error::format_message(const std::string& msg,
                                     const std::source_location& loc) {
    return msg + " [at " + loc.file_name() + ":"
           + std::to_string(loc.line()) + "]";
}

di_error::di_error(const std::string& message, std::source_location loc)
    : std::runtime_error(format_message(message, loc))
    , location_(loc)
{}

void di_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

void di_error::append_resolution_context(const std::string& component_info) {
    if (!resolution_context_.empty()) {
        resolution_context_ += " -> ";
    }
    resolution_context_ += component_info;
    cached_what_.clear();
}

const char* di_error::what() const noexcept {
    if (resolution_context_.empty()) {
        return std::runtime_error::what();
    }
    if (cached_what_.empty()) {
        try {
            cached_what_ = std::string(std::runtime_error::what())
                           + " (while resolving " + resolution_context_ + ")";
        } catch (const std::bad_alloc&) {
            return std::runtime_error::what();
        }
    }
    return cached_what_.c_str();
}

std::string di_error::full_diagnostic() const {
    if (diagnostic_detail_.empty()) {
        return what();
    }
    return std::string(what()) + "\n" + diagnostic_detail_;
}

not_found::not_found(const type_expr& type, std::string_view hint,
                     std::source_location loc)
    : di_error([&]() {
          std::string msg = "Service not found: " + type.to_string();
          if (!hint.empty())
              msg += "; " + std::string(hint);
          return msg;
      }(), loc)
    , requested_(type.to_string())
{}

std::string cyclic_dependency::build_message(const std::vector<std::string>& cycle) {
    std::string msg = "Cyclic dependency detected: ";
    for (std::size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) msg += " -> ";
        msg += cycle[i];
    }
    return msg;
}

cyclic_dependency::cyclic_dependency(std::vector<std::string> cycle,
                                     std::source_location loc)
    : di_error(build_message(cycle), loc)
    , cycle_(std::move(cycle))
{}

resolution_error::resolution_error(std::string_view component,
                                   const std::exception& inner,
                                   std::source_location loc)
    : di_error("Failed to create " + std::string(component) + ": " + inner.what(), loc)
{}

std::string multi_error::build_message(const std::vector<std::exception_ptr>& errors) {
    std::string msg = "A provider failed with " + std::to_string(errors.size())
                      + (errors.size() == 1 ? " error" : " errors");
    for (const auto& e : errors) {
        if (!e) continue;
        try {
            std::rethrow_exception(e);
        } catch (const std::exception& inner) {
            msg += "\n  ";
            msg += inner.what();
        } catch (...) {
            msg += "\n  (non-standard exception)";
        }
    }
    return msg;
}

multi_error::multi_error(std::vector<std::exception_ptr> errors,
                         std::source_location loc)
    : di_error(build_message(errors), loc)
    , errors_(std::move(errors))
{}

destroy_method_not_found::destroy_method_not_found(std::string_view method,
                                                   std::string_view provider,
                                                   std::source_location loc)
    : di_error("Destroy method \"" + std::string(method) + "\" for "
               + std::string(provider) + " not found", loc)
{}

} // namespace librtprov
