#include "codec/type_registry.hpp"
#include "core/errors.hpp"
#include "core/result.hpp"

#include <mutex>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace verdict::codec {

TypeRegistry& TypeRegistry::global() {
    static TypeRegistry registry;
    static const bool seeded = (registry.register_builtins(), true);
    (void)seeded;
    return registry;
}

void TypeRegistry::register_builtins() {
    register_code<NoneCode>("verdict::NoneCode");
    register_error<Error>("verdict::Error", [](const FieldReader& fields) {
        return make_error<Error>(fields.code(), fields.description());
    });

    register_simple_error<ApiError>("verdict::ApiError");
    register_simple_error<BusinessRuleViolationError>(
        "verdict::BusinessRuleViolationError");
    register_simple_error<ConfigurationError>("verdict::ConfigurationError");
    register_simple_error<ConflictError>("verdict::ConflictError");
    register_simple_error<NotFoundError>("verdict::NotFoundError");
    register_simple_error<UnauthorizedError>("verdict::UnauthorizedError");
    register_simple_error<UnhandledExceptionError>(
        "verdict::UnhandledExceptionError");
    register_simple_error<ValidationError>("verdict::ValidationError");
}

void TypeRegistry::add_error(ErrorEntry entry) {
    std::unique_lock lock(mutex_);

    auto by_tag = errors_.find(entry.tag);
    if (by_tag != errors_.end()) {
        if (by_tag->second.type == entry.type) return;
        throw std::invalid_argument("Error tag '" + entry.tag +
                                    "' is already registered for another type");
    }
    if (error_tags_.contains(entry.type)) {
        throw std::invalid_argument("Error type for tag '" + entry.tag +
                                    "' is already registered as '" +
                                    error_tags_.at(entry.type) + "'");
    }
    if (codes_.contains(entry.tag)) {
        throw std::invalid_argument("Tag '" + entry.tag +
                                    "' is already used by an ErrorCode");
    }

    spdlog::debug("Registered Error type '{}'", entry.tag);
    error_tags_.emplace(entry.type, entry.tag);
    std::string tag = entry.tag;
    errors_.emplace(std::move(tag), std::move(entry));
}

void TypeRegistry::add_code(std::string tag, const ErrorCode& instance) {
    std::unique_lock lock(mutex_);
    std::type_index type(typeid(instance));

    auto by_tag = codes_.find(tag);
    if (by_tag != codes_.end()) {
        if (by_tag->second == &instance) return;
        throw std::invalid_argument("ErrorCode tag '" + tag +
                                    "' is already registered for another type");
    }
    if (code_tags_.contains(type)) {
        throw std::invalid_argument("ErrorCode for tag '" + tag +
                                    "' is already registered as '" +
                                    code_tags_.at(type) + "'");
    }
    if (errors_.contains(tag)) {
        throw std::invalid_argument("Tag '" + tag + "' is already used by an Error");
    }

    spdlog::debug("Registered ErrorCode '{}' ({})", tag, instance.name());
    code_tags_.emplace(type, tag);
    codes_.emplace(std::move(tag), &instance);
}

std::optional<TypeRegistry::ErrorEntry> TypeRegistry::find_error(
    std::string_view tag) const {
    std::shared_lock lock(mutex_);
    auto it = errors_.find(std::string(tag));
    if (it == errors_.end()) return std::nullopt;
    return it->second;
}

std::optional<TypeRegistry::ErrorEntry> TypeRegistry::find_error(
    const std::type_info& type) const {
    std::shared_lock lock(mutex_);
    auto tag = error_tags_.find(std::type_index(type));
    if (tag == error_tags_.end()) return std::nullopt;
    return errors_.at(tag->second);
}

const ErrorCode* TypeRegistry::find_code(std::string_view tag) const {
    std::shared_lock lock(mutex_);
    auto it = codes_.find(std::string(tag));
    return it == codes_.end() ? nullptr : it->second;
}

std::optional<std::string> TypeRegistry::code_tag(const ErrorCode& code) const {
    std::shared_lock lock(mutex_);
    auto it = code_tags_.find(std::type_index(typeid(code)));
    if (it == code_tags_.end()) return std::nullopt;
    return it->second;
}

} // namespace verdict::codec
