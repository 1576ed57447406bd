#pragma once

/**
 * @file any_optional.h
 * @brief Optional values whose element type is only known at runtime.
 *
 * An OptionalBox holds a std::optional<T> for some T chosen at runtime. Boxes are built from type-erased
 * values (AnyValue) by a factory looked up in the OptionalFactoryRegistry under the value's exact runtime
 * type, so an int32_t is boxed as std::optional<int32_t> and never as a wider or converted type.
 *
 * Usage:
 * @code
 * auto box = optval::dynamic_to_optional(optval::make_any_value(int32_t{7}));
 * box.element_type() == optval::TypeId::of<int32_t>();   // true
 * *box.get_if<int32_t>() == 7;                           // true
 *
 * // Types outside the scalar catalog must be registered first
 * optval::OptionalFactoryRegistry::instance().register_type<Point>("point");
 * @endcode
 */

#include <optval/optval_export.h>
#include <optval/types/any_value.h>
#include <optval/types/optional.h>
#include <optval/util/errors.h>

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace optval {

    /**
     * @brief A type-erased std::optional<T>.
     *
     * A default constructed box is untyped (valid() is false). A typed box is either present or absent, and
     * is immutable once built.
     */
    class OPTVAL_EXPORT OptionalBox {
    public:
        OptionalBox() = default;

        template<typename T>
        static OptionalBox of(std::optional<T> value) {
            OptionalBox box;
            box._present = value.has_value();
            box._element_type = TypeId::of<T>();
            box._value.template emplace<std::optional<T>>(std::move(value));
            return box;
        }

        /// True when the box carries an element type (present or absent)
        [[nodiscard]] bool valid() const noexcept { return _element_type.valid(); }

        /// True when the box holds a value
        [[nodiscard]] bool has_value() const noexcept { return _present; }

        [[nodiscard]] TypeId element_type() const noexcept { return _element_type; }

        /// The boxed optional, or nullptr if the element type is not T
        template<typename T>
        [[nodiscard]] const std::optional<T> *get_if() const noexcept {
            return _value.template get_if<std::optional<T>>();
        }

        /**
         * Lower the box to a T, the zero value of T when absent.
         *
         * @throws TypeConstructionError if the box does not hold a std::optional<T>
         */
        template<typename T>
        [[nodiscard]] T value_or_zero() const {
            const auto *opt = get_if<T>();
            if (opt == nullptr) {
                throw_error<TypeConstructionError>("OptionalBox holds '{}', requested '{}'", _element_type.name(),
                                                   TypeId::of<T>().name());
            }
            return from_optional(*opt);
        }

        [[nodiscard]] const AnyValue<> &storage() const noexcept { return _value; }

        [[nodiscard]] std::string to_string() const;

        friend bool operator==(const OptionalBox &a, const OptionalBox &b) noexcept { return a._value == b._value; }
        friend bool operator!=(const OptionalBox &a, const OptionalBox &b) noexcept { return !(a == b); }

    private:
        AnyValue<> _value;
        TypeId _element_type{};
        bool _present{false};
    };

    /**
     * @brief The per-type operations the dynamic path needs.
     *
     * Plain function pointers, generated for each T by make_optional_factory<T>.
     */
    struct OptionalFactory {
        TypeId element_type;
        std::string name;
        OptionalBox (*lift)(const AnyValue<> &value);
        AnyValue<> (*lower)(const OptionalBox &box);
        OptionalBox (*absent)();
    };

    template<typename T>
    OptionalFactory make_optional_factory(std::string name) {
        return OptionalFactory{
            TypeId::of<T>(),
            std::move(name),
            [](const AnyValue<> &value) -> OptionalBox {
                const T *v = value.template get_if<T>();
                if (v == nullptr) {
                    throw_error<TypeConstructionError>("Cannot box '{}' as optional '{}'", value.type().name(),
                                                       TypeId::of<T>().name());
                }
                return OptionalBox::of<T>(to_optional(*v));
            },
            [](const OptionalBox &box) -> AnyValue<> { return make_any_value(box.value_or_zero<T>()); },
            []() -> OptionalBox { return OptionalBox::of<T>(std::nullopt); }
        };
    }

    /**
     * @brief Process wide table of optional factories keyed by runtime type.
     *
     * Every scalar catalog type is registered when the registry is first used. Lookups and registrations are
     * safe to call concurrently; a factory reference, once returned, stays valid for the life of the process.
     */
    class OPTVAL_EXPORT OptionalFactoryRegistry {
    public:
        /// Get the singleton instance
        static OptionalFactoryRegistry &instance();

        OptionalFactoryRegistry(const OptionalFactoryRegistry &) = delete;
        OptionalFactoryRegistry &operator=(const OptionalFactoryRegistry &) = delete;
        OptionalFactoryRegistry(OptionalFactoryRegistry &&) = delete;
        OptionalFactoryRegistry &operator=(OptionalFactoryRegistry &&) = delete;

        /**
         * @brief Register T so it can be boxed dynamically.
         *
         * If T is already registered the existing factory is returned and the name is ignored.
         *
         * @param name Display name, defaults to the catalog name or the C++ type name
         */
        template<typename T>
        const OptionalFactory &register_type(std::string name = {}) {
            if (name.empty()) {
                const char *catalog_name = type_name<T>();
                name = catalog_name != nullptr ? catalog_name : TypeId::of<T>().name();
            }
            return insert(make_optional_factory<T>(std::move(name)));
        }

        /// The factory for the type, or nullptr if it is not registered
        [[nodiscard]] const OptionalFactory *find(TypeId type) const;

        [[nodiscard]] bool contains(TypeId type) const { return find(type) != nullptr; }

        template<typename T>
        [[nodiscard]] bool contains() const { return contains(TypeId::of<T>()); }

        /// Names of the registered types, sorted
        [[nodiscard]] std::vector<std::string> registered_names() const;

        // Static configuration
        static void set_trace(bool value);
        [[nodiscard]] static bool trace_enabled();

    private:
        OptionalFactoryRegistry();
        ~OptionalFactoryRegistry() = default;

        const OptionalFactory &insert(OptionalFactory factory);

        mutable std::shared_mutex _mutex;
        std::unordered_map<std::type_index, std::unique_ptr<OptionalFactory>> _factories;

        static std::atomic<bool> _trace;
    };

    /**
     * Box a runtime-typed value as a present optional of exactly the same type.
     *
     * @throws TypeConstructionError if the value is empty or its type is not registered
     */
    OPTVAL_EXPORT OptionalBox dynamic_to_optional(const AnyValue<> &value);

    /**
     * Lower a box to a runtime-typed value of its element type, the zero value when the box is absent.
     *
     * @throws TypeConstructionError if the box is untyped or its element type is not registered
     */
    OPTVAL_EXPORT AnyValue<> dynamic_from_optional(const OptionalBox &box);

    /**
     * An absent box for a registered element type.
     *
     * @throws TypeConstructionError if the type is not registered
     */
    OPTVAL_EXPORT OptionalBox make_absent_optional(TypeId type);

} // namespace optval

namespace fmt {
    template<>
    struct formatter<optval::OptionalBox> : formatter<string_view> {
        // parse is inherited from formatter<string_view>.
        template<typename FormatContext>
        auto format(const optval::OptionalBox &box, FormatContext &ctx) const {
            return formatter<string_view>::format(box.to_string(), ctx);
        }
    };
} // namespace fmt
