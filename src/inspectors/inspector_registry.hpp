// inspector_registry.hpp
#pragma once
#include "base_inspector.hpp"
#include <functional>
#include <vector>
#include <memory>

class InspectorRegistry {
public:
    using Creator = std::function<std::unique_ptr<BaseInspector>()>;

    static InspectorRegistry& instance() {
        static InspectorRegistry registry;
        return registry;
    }

    void registerInspector(Creator creator) {
        creators.push_back(std::move(creator));
    }

    std::vector<std::unique_ptr<BaseInspector>> createAll() const {
        std::vector<std::unique_ptr<BaseInspector>> result;
        for (const auto& creator : creators) {
            result.push_back(creator());
        }
        return result;
    }

    // nullptr when no inspector handles the type
    std::unique_ptr<BaseInspector> createFor(const std::string& mimeType) const {
        for (const auto& creator : creators) {
            auto inspector = creator();
            if (inspector->mimeType() == mimeType) {
                return inspector;
            }
        }
        return nullptr;
    }

private:
    std::vector<Creator> creators;
};
