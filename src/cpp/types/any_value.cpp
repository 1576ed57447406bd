#include <optval/types/any_value.h>

#include <cstdlib>
#include <memory>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace optval
{
    bool operator==(TypeId a, TypeId b) noexcept {
        if (a.info == b.info) return true;
        return a.info && b.info && *a.info == *b.info;
    }

    std::string TypeId::name() const {
        if (info == nullptr) return "<untyped>";
#if defined(__GNUG__)
        int status{0};
        std::unique_ptr<char, void (*)(void *)> demangled{
            abi::__cxa_demangle(info->name(), nullptr, nullptr, &status), std::free};
        if (status == 0 && demangled) return demangled.get();
#endif
        return info->name();
    }

    std::string to_string(const AnyValue<> &v) { return v.to_string(); }
}  // namespace optval
