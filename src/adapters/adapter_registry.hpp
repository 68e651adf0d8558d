// adapter_registry.hpp
#pragma once
#include "scanner_adapter.hpp"
#include "config.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>

// Adapters are looked up by the custom_scanner "type" tag.
class AdapterRegistry {
public:
    using Creator = std::function<std::unique_ptr<ScannerAdapter>(const CustomScannerConfig&)>;

    static AdapterRegistry& instance() {
        static AdapterRegistry registry;
        return registry;
    }

    void registerAdapter(const std::string& type, Creator creator) {
        creators[type] = std::move(creator);
    }

    // nullptr for an unknown type
    std::unique_ptr<ScannerAdapter> create(const CustomScannerConfig& config) const {
        auto it = creators.find(config.type);
        if (it == creators.end()) {
            return nullptr;
        }
        return it->second(config);
    }

private:
    std::map<std::string, Creator> creators;
};
