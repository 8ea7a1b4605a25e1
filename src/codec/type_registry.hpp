#pragma once

#include "codec/fields.hpp"
#include "core/error.hpp"
#include "core/error_code.hpp"

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

namespace verdict::codec {

/// Explicit table of serializable Error and ErrorCode variants, keyed by a
/// stable tag (the "$type" discriminator on the wire).
///
/// Nothing is discovered at runtime: every variant a process wants to read
/// or write is registered here once, usually at startup. global() comes
/// with the built-in variants; consumers add their own to it.
class TypeRegistry {
public:
    /// Rebuilds an Error from its fields. May throw; the codec reports any
    /// exception as a DecodeError naming the tag.
    using Decoder = std::function<ErrorPtr(const FieldReader&)>;

    /// Writes the fields a variant adds beyond code and description.
    /// Fields it leaves out are not serialized.
    using Encoder = std::function<void(const Error&, FieldWriter&)>;

    struct ErrorEntry {
        std::string tag;
        std::type_index type;
        Decoder decode;
        Encoder encode;
    };

    TypeRegistry() = default;

    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    /// Process-wide registry, created with the built-ins on first use.
    static TypeRegistry& global();

    /// Register verdict::Error, the None code and all built-in variants.
    void register_builtins();

    /// Registering the same tag for the same type again is a no-op. Reusing
    /// a tag for another type, or a second tag for a type, throws
    /// std::invalid_argument.
    template <typename E>
    void register_error(std::string tag, Decoder decode, Encoder encode = {}) {
        static_assert(std::is_base_of_v<Error, E>,
                      "register_error() needs a verdict::Error subtype");
        add_error(ErrorEntry{std::move(tag), typeid(E), std::move(decode),
                             std::move(encode)});
    }

    /// C must expose a static instance() returning its singleton.
    template <typename C>
    void register_code(std::string tag) {
        static_assert(std::is_base_of_v<ErrorCode, C>,
                      "register_code() needs a verdict::ErrorCode subtype");
        add_code(std::move(tag), C::instance());
    }

    /// Shorthand for the common shape: E(description) with a nested Code.
    /// The code is registered as "<tag>::Code".
    template <typename E>
    void register_simple_error(std::string tag) {
        register_code<typename E::Code>(tag + "::Code");
        register_error<E>(std::move(tag), [](const FieldReader& fields) {
            return make_error<E>(fields.description());
        });
    }

    std::optional<ErrorEntry> find_error(std::string_view tag) const;
    std::optional<ErrorEntry> find_error(const std::type_info& type) const;

    /// The canonical singleton registered under tag, or nullptr.
    const ErrorCode* find_code(std::string_view tag) const;

    /// Tag of the code's dynamic type, if registered.
    std::optional<std::string> code_tag(const ErrorCode& code) const;

private:
    void add_error(ErrorEntry entry);
    void add_code(std::string tag, const ErrorCode& instance);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ErrorEntry> errors_;
    std::unordered_map<std::type_index, std::string> error_tags_;
    std::unordered_map<std::string, const ErrorCode*> codes_;
    std::unordered_map<std::type_index, std::string> code_tags_;
};

} // namespace verdict::codec
