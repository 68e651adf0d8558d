// adapter_registration.hpp
#pragma once
#include "adapter_registry.hpp"

#define REGISTER_SCANNER_ADAPTER(CLASSNAME, TYPE) \
    namespace { \
        struct CLASSNAME##_AutoRegister { \
            CLASSNAME##_AutoRegister() { \
                AdapterRegistry::instance().registerAdapter(TYPE, [](const CustomScannerConfig& config) { \
                    return std::make_unique<CLASSNAME>(config); \
                }); \
            } \
        }; \
        static CLASSNAME##_AutoRegister global_##CLASSNAME##_AutoRegister; \
    }
