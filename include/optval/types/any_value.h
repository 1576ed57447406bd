#ifndef OPTVAL_ANY_VALUE_H
#define OPTVAL_ANY_VALUE_H

#include <concepts>
#include <cstddef>
#include <cstring>
#include <functional>
#include <new>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include <optval/optval_export.h>
#include <optval/types/scalar_types.h>

namespace optval
{
    // Inline buffer size; large enough to keep every catalog scalar, and its std::optional, out of the heap.
#ifndef OPTVAL_ANY_VALUE_SBO
#define OPTVAL_ANY_VALUE_SBO (sizeof(std::optional<std::string>))
#endif

    inline constexpr std::size_t ANY_VALUE_SBO   = OPTVAL_ANY_VALUE_SBO;
    inline constexpr std::size_t ANY_VALUE_ALIGN = alignof(std::max_align_t);

    // Runtime type descriptor of a type-erased value
    struct OPTVAL_EXPORT TypeId
    {
        const std::type_info *info{};

        template <typename T> static TypeId of() noexcept { return TypeId{&typeid(T)}; }

        [[nodiscard]] bool        valid() const noexcept { return info != nullptr; }
        [[nodiscard]] std::string name() const;
    };

    OPTVAL_EXPORT bool operator==(TypeId a, TypeId b) noexcept;

    inline bool operator!=(TypeId a, TypeId b) noexcept { return !(a == b); }

    /**
     * A type-erased, owning value holder with small buffer optimisation.
     *
     * The holder remembers the exact C++ type it was filled with (see type()), equality compares type and
     * value, and copies are deep. Values larger than the inline buffer are kept on the heap.
     */
    template <std::size_t SBO = ANY_VALUE_SBO, std::size_t Align = ANY_VALUE_ALIGN>
    class AnyValue
    {
    public:
        AnyValue() noexcept : vtable_(nullptr), using_heap_(false) {}

        AnyValue(const AnyValue &other) : vtable_(nullptr), using_heap_(false) {
            if (other.vtable_) other.vtable_->copy(*this, other);
        }

        AnyValue(AnyValue &&other) noexcept : vtable_(nullptr), using_heap_(false) {
            if (other.vtable_) other.vtable_->move(*this, other);
        }

        AnyValue &operator=(const AnyValue &other) {
            if (this != &other) {
                AnyValue tmp(other);
                reset();
                if (tmp.vtable_) tmp.vtable_->move(*this, tmp);
            }
            return *this;
        }

        AnyValue &operator=(AnyValue &&other) noexcept {
            if (this != &other) {
                reset();
                if (other.vtable_) other.vtable_->move(*this, other);
            }
            return *this;
        }

        ~AnyValue() { reset(); }

        void reset() noexcept {
            if (vtable_) vtable_->destroy(*this);
            vtable_     = nullptr;
            using_heap_ = false;
        }

        [[nodiscard]] bool   has_value() const noexcept { return vtable_ != nullptr; }
        [[nodiscard]] TypeId type() const noexcept { return has_value() ? vtable_->type : TypeId{}; }

        template <class T, class... Args>
        T &emplace(Args &&... args) {
            static_assert(std::is_copy_constructible_v<T>, "AnyValue requires copyable types");
            reset();
            if constexpr (fits_inline<T>()) {
                new(storage_ptr()) T(std::forward<Args>(args)...);
                using_heap_ = false;
            } else {
                T *p = new T(std::forward<Args>(args)...);
                std::memcpy(storage_, &p, sizeof(T *));
                using_heap_ = true;
            }
            vtable_ = &vtable_for<T>();
            return *static_cast<T *>(get_ptr());
        }

        template <class T>
        T *get_if() noexcept {
            if (!vtable_ || *vtable_->type.info != typeid(T)) return nullptr;
            return static_cast<T *>(get_ptr());
        }

        template <class T>
        const T *get_if() const noexcept {
            if (!vtable_ || *vtable_->type.info != typeid(T)) return nullptr;
            return static_cast<const T *>(get_ptr());
        }

        template <class T>
        [[nodiscard]] bool is() const noexcept { return get_if<T>() != nullptr; }

        // Hash of the contained value (type-aware). Returns 0 if empty.
        [[nodiscard]] std::size_t hash_code() const noexcept { return vtable_ ? vtable_->hash(*this) : 0; }

        [[nodiscard]] std::string to_string() const { return vtable_ ? vtable_->to_string(*this) : "<empty>"; }

        /// Returns true if the value is stored inline (using SBO), false if heap-allocated or empty.
        [[nodiscard]] bool is_inline() const noexcept { return vtable_ && !using_heap_; }

        /// Visit the value if it contains type T, otherwise do nothing.
        /// Returns true if the visitor was invoked, false if empty or type mismatch.
        template <typename T, typename Visitor>
        bool visit_as(Visitor &&visitor) const {
            if (const T *p = get_if<T>()) {
                std::forward<Visitor>(visitor)(*p);
                return true;
            }
            return false;
        }

        // Equality: type + value. Empty equals empty. Different types -> false.
        friend bool operator==(const AnyValue &a, const AnyValue &b) noexcept {
            if (!a.vtable_ && !b.vtable_) return true;
            if (!a.vtable_ || !b.vtable_) return false;
            if (a.vtable_->type != b.vtable_->type) return false;
            return a.vtable_->equals(a, b);
        }

        friend bool operator!=(const AnyValue &a, const AnyValue &b) noexcept { return !(a == b); }

    private:
        struct VTable
        {
            TypeId        type;
            void (*       copy)(AnyValue &, const AnyValue &);
            void (*       move)(AnyValue &, AnyValue &) noexcept;
            void (*       destroy)(AnyValue &) noexcept;
            std::size_t (*hash)(const AnyValue &) noexcept;
            bool (*       equals)(const AnyValue &, const AnyValue &) noexcept;
            std::string (*to_string)(const AnyValue &);
        };

        template <class T>
        static constexpr bool fits_inline() noexcept {
            return sizeof(T) <= SBO && alignof(T) <= Align && std::is_nothrow_move_constructible_v<T>;
        }

        template <class T>
        static const T &ref(const AnyValue &self) noexcept {
            return *static_cast<const T *>(self.get_ptr());
        }

        template <class T>
        static const VTable &vtable_for() {
            static const VTable vt{
                TypeId::of<T>(),
                // copy
                [](AnyValue &dst, const AnyValue &src) { dst.template emplace<T>(ref<T>(src)); },
                // move, heap values hand over the pointer
                [](AnyValue &dst, AnyValue &src) noexcept {
                    if (src.using_heap_) {
                        std::memcpy(dst.storage_, src.storage_, sizeof(T *));
                        dst.using_heap_ = true;
                    } else {
                        if constexpr (fits_inline<T>()) {
                            auto *sp = static_cast<T *>(src.storage_ptr());
                            new(dst.storage_ptr()) T(std::move(*sp));
                            sp->~T();
                        }
                        dst.using_heap_ = false;
                    }
                    dst.vtable_     = src.vtable_;
                    src.vtable_     = nullptr;
                    src.using_heap_ = false;
                },
                // destroy
                [](AnyValue &self) noexcept {
                    if (self.using_heap_) {
                        delete static_cast<T *>(self.get_ptr());
                    } else {
                        static_cast<T *>(self.storage_ptr())->~T();
                    }
                },
                // hash, falls back to the type when T has no std::hash
                [](const AnyValue &self) noexcept -> std::size_t {
                    if constexpr (requires(const T &x) { { std::hash<T>{}(x) } -> std::convertible_to<std::size_t>; }) {
                        return std::hash<T>{}(ref<T>(self));
                    } else {
                        return std::type_index(typeid(T)).hash_code();
                    }
                },
                // equals
                [](const AnyValue &a, const AnyValue &b) noexcept -> bool {
                    if constexpr (requires(const T &x, const T &y) { { x == y } -> std::convertible_to<bool>; }) {
                        return ref<T>(a) == ref<T>(b);
                    } else {
                        return a.get_ptr() == b.get_ptr();
                    }
                },
                // to_string
                [](const AnyValue &self) -> std::string { return format_value(ref<T>(self)); }
            };
            return vt;
        }

        template <class T>
        static std::string format_value(const T &value) {
            if constexpr (requires { value.has_value(); *value; }) {
                return value.has_value() ? format_scalar(*value) : std::string("<absent>");
            } else {
                return format_scalar(value);
            }
        }

        void *                    storage_ptr() noexcept { return static_cast<void *>(storage_); }
        [[nodiscard]] const void *storage_ptr() const noexcept { return static_cast<const void *>(storage_); }

        void *get_ptr() noexcept {
            if (using_heap_) return *reinterpret_cast<void **>(storage_);
            return storage_ptr();
        }

        [[nodiscard]] const void *get_ptr() const noexcept {
            if (using_heap_) return *reinterpret_cast<void * const*>(storage_);
            return storage_ptr();
        }

        const VTable *               vtable_;
        bool                         using_heap_;
        alignas(Align) unsigned char storage_[SBO < sizeof(void *) ? sizeof(void *) : SBO];
    };

    // Build an AnyValue holding exactly T, the std::decay of the argument type
    template <typename T>
    AnyValue<> make_any_value(T &&value) {
        AnyValue<> result;
        result.template emplace<std::decay_t<T>>(std::forward<T>(value));
        return result;
    }

    OPTVAL_EXPORT std::string to_string(const AnyValue<> &v);
} // namespace optval

namespace std
{
    template <>
    struct hash<optval::TypeId>
    {
        size_t operator()(const optval::TypeId &id) const noexcept {
            return id.info ? std::type_index(*id.info).hash_code() : 0;
        }
    };

    template <std::size_t SBO, std::size_t Align>
    struct hash<optval::AnyValue<SBO, Align>>
    {
        size_t operator()(const optval::AnyValue<SBO, Align> &v) const noexcept { return v.hash_code(); }
    };
}

#endif // OPTVAL_ANY_VALUE_H
