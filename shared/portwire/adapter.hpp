#pragma once
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "port.hpp"
#include "lifetime.hpp"
#include "errors.hpp"

namespace portwire {

    using Instance = std::shared_ptr<void>;

    // Resolved requirements handed to a factory, keyed by port name.
    class Dependencies
    {
    public:
        Dependencies() = default;
        explicit Dependencies(std::string owner) : owner_(std::move(owner)) {}

        template<typename T>
        [[nodiscard]] std::shared_ptr<T> get(const Port<T>& port) const
        {
            const auto& entry = find_(port.name());
            if (entry.first.type() != port.key().type()) {
                throw PortTypeMismatchError(port.name(),
                    static_cast<std::string>(entry.first.type()),
                    static_cast<std::string>(port.key().type()));
            }
            return std::static_pointer_cast<T>(entry.second);
        }

        bool contains(const std::string& port_name) const { return values_.count(port_name) != 0; }
        size_t size() const { return values_.size(); }

        void set(const PortKey& key, Instance instance)
        {
            values_.insert_or_assign(key.name(), std::make_pair(key, std::move(instance)));
        }

    private:
        const std::pair<PortKey, Instance>& find_(const std::string& port_name) const
        {
            auto it = values_.find(port_name);
            if (it == values_.end()) {
                throw PortNotFoundError(port_name,
                    owner_.empty() ? "not a declared dependency"
                                   : "not a declared dependency of '" + owner_ + "'");
            }
            return it->second;
        }

        std::string owner_;
        std::unordered_map<std::string, std::pair<PortKey, Instance>> values_;
    }; // class Dependencies


    using ErasedFactory = std::function<Instance(const Dependencies&)>;
    using ErasedFinalizer = std::function<void(const Instance&)>;
    using ErasedAsyncFinalizer = std::function<std::future<void>(const Instance&)>;

    // Immutable provider record: which port it provides, what it needs, how
    // long its instances live and how they are created and torn down.
    class Adapter
    {
    public:
        Adapter(PortKey provides,
                std::vector<PortKey> dependencies,
                Lifetime lifetime,
                ErasedFactory factory,
                ErasedFinalizer finalizer = nullptr,
                ErasedAsyncFinalizer async_finalizer = nullptr);

        const PortKey& provides() const { return provides_; }
        const std::string& portName() const { return provides_.name(); }
        const std::vector<PortKey>& dependencies() const { return dependencies_; }
        Lifetime lifetime() const { return lifetime_; }

        bool hasFinalizer() const { return finalizer_ != nullptr || async_finalizer_ != nullptr; }
        bool hasAsyncFinalizer() const { return async_finalizer_ != nullptr; }

        // Throws FactoryError when the factory throws or returns nullptr.
        // Container errors raised by nested resolution pass through unchanged.
        Instance create(const Dependencies& deps) const;

        // Runs the finalizer; an async finalizer is awaited before returning.
        void finalize(const Instance& instance) const;

    private:
        PortKey provides_;
        std::vector<PortKey> dependencies_;
        Lifetime lifetime_;
        ErasedFactory factory_;
        ErasedFinalizer finalizer_;
        ErasedAsyncFinalizer async_finalizer_;
    }; // class Adapter

    using AdapterPtr = std::shared_ptr<const Adapter>;


    // Typed front end for Adapter construction.
    //
    //   auto logger = AdapterBuilder<Logger>(LoggerPort)
    //       .lifetime(Lifetime::Singleton)
    //       .factory([](const Dependencies&) { return std::make_shared<ConsoleLogger>(); })
    //       .build();
    template<typename T>
    class AdapterBuilder
    {
    public:
        explicit AdapterBuilder(const Port<T>& port) : provides_(port.key()) {}

        template<typename D>
        AdapterBuilder& dependsOn(const Port<D>& port) {
            return dependsOn(port.key());
        }

        AdapterBuilder& dependsOn(const PortKey& key) {
            for (const auto& existing : dependencies_) {
                if (existing == key) return *this;
            }
            dependencies_.push_back(key);
            return *this;
        }

        AdapterBuilder& lifetime(Lifetime l) {
            lifetime_ = l; return *this;
        }

        AdapterBuilder& factory(std::function<std::shared_ptr<T>(const Dependencies&)> f) {
            factory_ = std::move(f); return *this;
        }

        AdapterBuilder& finalizer(std::function<void(T&)> f) {
            finalizer_ = std::move(f); async_finalizer_ = nullptr; return *this;
        }

        AdapterBuilder& asyncFinalizer(std::function<std::future<void>(std::shared_ptr<T>)> f) {
            async_finalizer_ = std::move(f); finalizer_ = nullptr; return *this;
        }

        AdapterPtr build() const {
            if (!factory_)
                throw std::invalid_argument("AdapterBuilder requires factory() for port '" + provides_.name() + "'");

            auto typed_factory = factory_;
            ErasedFactory erased_factory = [typed_factory](const Dependencies& deps) -> Instance {
                return std::static_pointer_cast<void>(typed_factory(deps));
            };

            ErasedFinalizer erased_finalizer;
            if (finalizer_) {
                auto typed = finalizer_;
                erased_finalizer = [typed](const Instance& instance) {
                    typed(*std::static_pointer_cast<T>(instance));
                };
            }

            ErasedAsyncFinalizer erased_async;
            if (async_finalizer_) {
                auto typed = async_finalizer_;
                erased_async = [typed](const Instance& instance) {
                    return typed(std::static_pointer_cast<T>(instance));
                };
            }

            return std::make_shared<Adapter>(provides_, dependencies_, lifetime_,
                std::move(erased_factory), std::move(erased_finalizer), std::move(erased_async));
        }

    private:
        PortKey provides_;
        std::vector<PortKey> dependencies_;
        Lifetime lifetime_ = Lifetime::Singleton;
        std::function<std::shared_ptr<T>(const Dependencies&)> factory_;
        std::function<void(T&)> finalizer_;
        std::function<std::future<void>(std::shared_ptr<T>)> async_finalizer_;
    }; // class AdapterBuilder


    template<typename T>
    inline AdapterBuilder<T> makeAdapter(const Port<T>& port) {
        return AdapterBuilder<T>(port);
    }

}; // namespace portwire
