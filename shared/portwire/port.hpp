#pragma once
#include <string>
#include <utility>
#include <functional>

#include "type_info.hpp"

namespace portwire {

    // Type-erased port descriptor. Two keys with the same name denote the same
    // port; the TypeId only serves the typed lookups.
    class PortKey
    {
    public:
        PortKey(std::string name, TypeId type)
            : name_(std::move(name)), type_(type) {}

        const std::string& name() const { return name_; }
        TypeId type() const { return type_; }

        bool operator==(const PortKey& other) const { return name_ == other.name_; }
        bool operator!=(const PortKey& other) const { return name_ != other.name_; }
        bool operator<(const PortKey& other) const { return name_ < other.name_; }

    private:
        std::string name_;
        TypeId type_;
    }; // class PortKey


    // Named contract for a service of type T.
    template<typename T>
    class Port
    {
    public:
        using value_type = T;

        explicit Port(std::string name)
            : key_(std::move(name), getTypeId<T>()) {}

        const std::string& name() const { return key_.name(); }
        const PortKey& key() const { return key_; }

        operator const PortKey&() const { return key_; }

        bool operator==(const Port& other) const { return key_ == other.key_; }
        bool operator!=(const Port& other) const { return key_ != other.key_; }

    private:
        PortKey key_;
    }; // class Port


    template<typename T>
    inline Port<T> makePort(std::string name) {
        return Port<T>(std::move(name));
    }

}; // namespace portwire


namespace std {

    template <>
    struct hash<portwire::PortKey> {
        size_t operator()(const portwire::PortKey& key) const noexcept {
            return std::hash<std::string>()(key.name());
        }
    };

} // namespace std
