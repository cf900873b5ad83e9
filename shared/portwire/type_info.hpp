#pragma once
#include <typeinfo>
#include <type_traits>
#include <functional>
#include <string>

#include "helper.hpp"

namespace portwire
{

    // Wrapping class for type inference for classes where RTTI type inference is difficult
    template<typename T>
    class TypeWrapper
    {
    };

    // Similar to std::type_index, but one static instance exists per type so the
    // address alone identifies it.
    struct alignas(void*) TypeInfo {

        explicit TypeInfo(const std::type_info& info, bool is_abstract)
            : info(&info), is_abstract(is_abstract) {}

        // demangled name of the wrapped type
        std::string name() const {
            if (info == nullptr)
                return "<unknown>";
            auto full = demangle(info->name());
            const std::string prefix = "portwire::TypeWrapper<";
            if (full.compare(0, prefix.size(), prefix) == 0 && full.back() == '>')
                return full.substr(prefix.size(), full.size() - prefix.size() - 1);
            return full;
        };

        bool isAbstract() const { return is_abstract; };

    private:
        const std::type_info* info;
        bool is_abstract;
    };

    struct TypeId {
        const TypeInfo* type_info = nullptr;

        explicit operator std::string() const { return type_info ? type_info->name() : "<none>"; };

        bool valid() const { return type_info != nullptr; };

        bool operator==(TypeId x) const { return type_info == x.type_info; };
        bool operator!=(TypeId x) const { return type_info != x.type_info; };
        bool operator<(TypeId x) const { return std::less<const TypeInfo*>()(type_info, x.type_info); };
    };

    template <typename T>
    inline TypeId getTypeId() {
        static TypeInfo info(typeid(TypeWrapper<T>), std::is_abstract<T>::value);
        return TypeId{ &info };
    };

}; // namespace portwire


namespace std {

    template <>
    struct hash<portwire::TypeId> {
        size_t operator()(portwire::TypeId id) const noexcept {
            return std::hash<const portwire::TypeInfo*>()(id.type_info);
        }
    };

} // namespace std
