#pragma once
#include <optional>
#include <string>

namespace portwire {

    // Instantiation policy of an adapter.
    // singleton: one per container, scoped: one per scope, request: one per resolve
    enum class Lifetime
    {
        Singleton,
        Scoped,
        Request,
    };

    constexpr const char* to_string(Lifetime lifetime) {
        switch (lifetime) {
            case Lifetime::Singleton: return "singleton";
            case Lifetime::Scoped:    return "scoped";
            case Lifetime::Request:   return "request";
        }
        return "unknown";
    }

    // Longer-lived policies have a lower rank.
    constexpr int lifetimeRank(Lifetime lifetime) {
        switch (lifetime) {
            case Lifetime::Singleton: return 1;
            case Lifetime::Scoped:    return 2;
            case Lifetime::Request:   return 3;
        }
        return 0;
    }

    inline std::optional<Lifetime> parseLifetime(const std::string& name) {
        if (name == "singleton") return Lifetime::Singleton;
        if (name == "scoped")    return Lifetime::Scoped;
        if (name == "request")   return Lifetime::Request;
        return std::nullopt;
    }

}; // namespace portwire
