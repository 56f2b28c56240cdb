/**
 * @file features.hpp
 * @brief Compile-time feature selection (module variant, sockets, radio roles)
 * @version 1.0
 * @date 2025-11-18
 *
 * Driven by compile definitions set from CMake options:
 *
 * - UBLOX_MODULE_ODIN_W2XX | UBLOX_MODULE_NINA_W1XX | UBLOX_MODULE_NINA_B1XX |
 *   UBLOX_MODULE_ANNA_B1XX | UBLOX_MODULE_NINA_B2XX | UBLOX_MODULE_NINA_B3XX (exactly one)
 *
 * - UBLOX_FEATURE_SOCKET_TCP, UBLOX_FEATURE_SOCKET_UDP (0/1)
 *
 * - UBLOX_FEATURE_WIFI_STA, UBLOX_FEATURE_WIFI_AP, UBLOX_FEATURE_BLUETOOTH (0/1)
 *
 * - UBLOX_FEATURE_ASYNC (0/1)
 *
 * - UBLOX_MAX_SOCKETS, UBLOX_SOCKET_RX_BUFFER, UBLOX_SOCKET_TX_BUFFER
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstddef>
#include <string>

// === Module variant (exactly one) ===
#if (defined(UBLOX_MODULE_ODIN_W2XX) + defined(UBLOX_MODULE_NINA_W1XX) + \
    defined(UBLOX_MODULE_NINA_B1XX) + defined(UBLOX_MODULE_ANNA_B1XX) + \
    defined(UBLOX_MODULE_NINA_B2XX) + defined(UBLOX_MODULE_NINA_B3XX)) != 1
#error "Exactly one UBLOX_MODULE_* variant must be defined"
#endif

#ifndef UBLOX_FEATURE_SOCKET_TCP
#define UBLOX_FEATURE_SOCKET_TCP 1
#endif
#ifndef UBLOX_FEATURE_SOCKET_UDP
#define UBLOX_FEATURE_SOCKET_UDP 1
#endif
#ifndef UBLOX_FEATURE_WIFI_STA
#define UBLOX_FEATURE_WIFI_STA 1
#endif
#ifndef UBLOX_FEATURE_WIFI_AP
#define UBLOX_FEATURE_WIFI_AP 0
#endif
#ifndef UBLOX_FEATURE_BLUETOOTH
#define UBLOX_FEATURE_BLUETOOTH 0
#endif
#ifndef UBLOX_FEATURE_ASYNC
#define UBLOX_FEATURE_ASYNC 0
#endif
#ifndef UBLOX_MAX_SOCKETS
#define UBLOX_MAX_SOCKETS 4
#endif
#ifndef UBLOX_SOCKET_RX_BUFFER
#define UBLOX_SOCKET_RX_BUFFER 2048
#endif
#ifndef UBLOX_SOCKET_TX_BUFFER
#define UBLOX_SOCKET_TX_BUFFER 1024
#endif

namespace ublox {

    /**
     * @brief Supported module families
     */
    enum class ModuleVariant {
        ODIN_W2XX,  ///< WiFi + Bluetooth Classic/LE, station and access point
        NINA_W1XX,  ///< WiFi + Bluetooth LE
        NINA_B1XX,  ///< Bluetooth LE
        ANNA_B1XX,  ///< Bluetooth LE
        NINA_B2XX,  ///< Bluetooth Classic/LE
        NINA_B3XX,  ///< Bluetooth LE
    };

    /**
     * @brief Radio capabilities of a module family
     */
    struct VariantTraits {
        const char* name;
        bool has_wifi;
        bool has_access_point;
        bool has_bluetooth;
    };

    constexpr VariantTraits variant_traits(ModuleVariant variant) {
        switch (variant) {
        case ModuleVariant::ODIN_W2XX: return {"ODIN-W2", true, true, true};
        case ModuleVariant::NINA_W1XX: return {"NINA-W1", true, true, true};
        case ModuleVariant::NINA_B1XX: return {"NINA-B1", false, false, true};
        case ModuleVariant::ANNA_B1XX: return {"ANNA-B1", false, false, true};
        case ModuleVariant::NINA_B2XX: return {"NINA-B2", false, false, true};
        case ModuleVariant::NINA_B3XX: return {"NINA-B3", false, false, true};
        }
        return {"unknown", false, false, false};
    }

    namespace features {

#if defined(UBLOX_MODULE_ODIN_W2XX)
        static constexpr ModuleVariant MODULE = ModuleVariant::ODIN_W2XX;
#elif defined(UBLOX_MODULE_NINA_W1XX)
        static constexpr ModuleVariant MODULE = ModuleVariant::NINA_W1XX;
#elif defined(UBLOX_MODULE_NINA_B1XX)
        static constexpr ModuleVariant MODULE = ModuleVariant::NINA_B1XX;
#elif defined(UBLOX_MODULE_ANNA_B1XX)
        static constexpr ModuleVariant MODULE = ModuleVariant::ANNA_B1XX;
#elif defined(UBLOX_MODULE_NINA_B2XX)
        static constexpr ModuleVariant MODULE = ModuleVariant::NINA_B2XX;
#else
        static constexpr ModuleVariant MODULE = ModuleVariant::NINA_B3XX;
#endif

        static constexpr bool SOCKET_TCP = UBLOX_FEATURE_SOCKET_TCP != 0;
        static constexpr bool SOCKET_UDP = UBLOX_FEATURE_SOCKET_UDP != 0;

        // Radio roles are only usable where the module family has the radio
        static constexpr bool WIFI_STA = UBLOX_FEATURE_WIFI_STA != 0 &&
            variant_traits(MODULE).has_wifi;
        static constexpr bool WIFI_AP = UBLOX_FEATURE_WIFI_AP != 0 &&
            variant_traits(MODULE).has_access_point;
        static constexpr bool BLUETOOTH = UBLOX_FEATURE_BLUETOOTH != 0 &&
            variant_traits(MODULE).has_bluetooth;

        static constexpr bool ASYNC = UBLOX_FEATURE_ASYNC != 0;

        static constexpr std::size_t MAX_SOCKETS = UBLOX_MAX_SOCKETS;
        static constexpr std::size_t SOCKET_RX_BUFFER = UBLOX_SOCKET_RX_BUFFER;
        static constexpr std::size_t SOCKET_TX_BUFFER = UBLOX_SOCKET_TX_BUFFER;

        static_assert(MAX_SOCKETS > 0 && MAX_SOCKETS <= 255, "UBLOX_MAX_SOCKETS out of range");

        inline std::string describe() {
            std::string s = variant_traits(MODULE).name;
            s += SOCKET_TCP ? " tcp" : "";
            s += SOCKET_UDP ? " udp" : "";
            s += WIFI_STA ? " wifi-sta" : "";
            s += WIFI_AP ? " wifi-ap" : "";
            s += BLUETOOTH ? " bluetooth" : "";
            s += ASYNC ? " async" : "";
            return s;
        }

    } // namespace features

} // namespace ublox
