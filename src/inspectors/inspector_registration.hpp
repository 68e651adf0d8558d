// inspector_registration.hpp
#pragma once
#include "inspector_registry.hpp"

#define REGISTER_INSPECTOR(CLASSNAME) \
    namespace { \
        struct CLASSNAME##_AutoRegister { \
            CLASSNAME##_AutoRegister() { \
                InspectorRegistry::instance().registerInspector([]() { \
                    return std::make_unique<CLASSNAME>(); \
                }); \
            } \
        }; \
        static CLASSNAME##_AutoRegister global_##CLASSNAME##_AutoRegister; \
    }
