#include <optval/types/any_optional.h>

#include <fmt/format.h>

#include <algorithm>
#include <cstdio>
#include <mutex>

namespace optval {

    // Static member initialization
    std::atomic<bool> OptionalFactoryRegistry::_trace{false};

    std::string OptionalBox::to_string() const {
        if (!valid()) return "<untyped>";
        const auto *factory = OptionalFactoryRegistry::instance().find(_element_type);
        return fmt::format("optional<{}>({})", factory != nullptr ? factory->name : _element_type.name(),
                           _value.to_string());
    }

    OptionalFactoryRegistry &OptionalFactoryRegistry::instance() {
        static OptionalFactoryRegistry registry;
        return registry;
    }

    OptionalFactoryRegistry::OptionalFactoryRegistry() {
        // Fixed width integers first, so an aliased platform-width type keeps the fixed width name
        register_type<ov_bool>();
        register_type<ov_int8>();
        register_type<ov_int16>();
        register_type<ov_int32>();
        register_type<ov_int64>();
        register_type<ov_int>();
        register_type<ov_uint8>();
        register_type<ov_uint16>();
        register_type<ov_uint32>();
        register_type<ov_uint64>();
        register_type<ov_uint>();
        register_type<ov_float32>();
        register_type<ov_float64>();
        register_type<ov_string>();
        register_type<ov_byte>();
        register_type<ov_rune>();
        register_type<ov_complex64>();
        register_type<ov_complex128>();
        register_type<ov_time>();
        register_type<ov_duration>();
    }

    void OptionalFactoryRegistry::set_trace(bool value) { _trace.store(value, std::memory_order_relaxed); }

    bool OptionalFactoryRegistry::trace_enabled() { return _trace.load(std::memory_order_relaxed); }

    const OptionalFactory &OptionalFactoryRegistry::insert(OptionalFactory factory) {
        std::unique_lock lock(_mutex);
        std::type_index idx(*factory.element_type.info);

        auto it = _factories.find(idx);
        if (it != _factories.end()) { return *it->second; }

        if (trace_enabled()) {
            fmt::print(stderr, "[optval] registered optional factory '{}' for {}\n", factory.name,
                       factory.element_type.name());
        }
        auto stored = std::make_unique<OptionalFactory>(std::move(factory));
        const OptionalFactory &result = *stored;
        _factories.emplace(idx, std::move(stored));
        return result;
    }

    const OptionalFactory *OptionalFactoryRegistry::find(TypeId type) const {
        if (!type.valid()) return nullptr;
        std::shared_lock lock(_mutex);
        auto it = _factories.find(std::type_index(*type.info));
        return it != _factories.end() ? it->second.get() : nullptr;
    }

    std::vector<std::string> OptionalFactoryRegistry::registered_names() const {
        std::vector<std::string> names;
        {
            std::shared_lock lock(_mutex);
            names.reserve(_factories.size());
            for (const auto &[_, factory] : _factories) { names.push_back(factory->name); }
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    namespace {
        const OptionalFactory &factory_for(TypeId type, const char *operation) {
            if (!type.valid()) {
                if (OptionalFactoryRegistry::trace_enabled()) {
                    fmt::print(stderr, "[optval] {}: no runtime type\n", operation);
                }
                throw_error<TypeConstructionError>("{}: value has no runtime type", operation);
            }
            const auto *factory = OptionalFactoryRegistry::instance().find(type);
            if (factory == nullptr) {
                if (OptionalFactoryRegistry::trace_enabled()) {
                    fmt::print(stderr, "[optval] {}: no optional factory for {}\n", operation, type.name());
                }
                throw_error<TypeConstructionError>("{}: no optional factory registered for '{}'", operation,
                                                   type.name());
            }
            return *factory;
        }
    } // namespace

    OptionalBox dynamic_to_optional(const AnyValue<> &value) {
        return factory_for(value.type(), "dynamic_to_optional").lift(value);
    }

    AnyValue<> dynamic_from_optional(const OptionalBox &box) {
        return factory_for(box.element_type(), "dynamic_from_optional").lower(box);
    }

    OptionalBox make_absent_optional(TypeId type) {
        return factory_for(type, "make_absent_optional").absent();
    }

} // namespace optval
