/**
 * @file baud_lookup.cpp
 * @brief Baud rate to platform constant tables
 * @version 0.1
 * @date 2025-10-14
 */

#include "../include/enums/serial.hpp"

#include <map>

#ifdef _WIN32
#include <windows.h>
#endif

namespace serialio {

    namespace {

#ifdef _WIN32
        const std::map<int, BaudConstant>& baud_table() {
            static const std::map<int, BaudConstant> table = {
                {110, CBR_110}, {300, CBR_300}, {600, CBR_600}, {1200, CBR_1200},
                {2400, CBR_2400}, {4800, CBR_4800}, {9600, CBR_9600},
                {14400, CBR_14400}, {19200, CBR_19200}, {38400, CBR_38400},
                {56000, CBR_56000}, {57600, CBR_57600}, {115200, CBR_115200},
                {128000, CBR_128000}, {256000, CBR_256000},
                // Not named by the SDK but accepted by most USB-serial drivers
                {230400, 230400}, {460800, 460800}, {921600, 921600},
                {1000000, 1000000}, {2000000, 2000000}, {3000000, 3000000},
            };
            return table;
        }
#else
        const std::map<int, BaudConstant>& baud_table() {
            static const std::map<int, BaudConstant> table = {
                {50, B50}, {75, B75}, {110, B110}, {134, B134}, {150, B150},
                {200, B200}, {300, B300}, {600, B600}, {1200, B1200},
                {1800, B1800}, {2400, B2400}, {4800, B4800}, {9600, B9600},
                {19200, B19200}, {38400, B38400}, {57600, B57600},
                {115200, B115200}, {230400, B230400},
#ifdef B460800
                {460800, B460800},
#endif
#ifdef B500000
                {500000, B500000},
#endif
#ifdef B576000
                {576000, B576000},
#endif
#ifdef B921600
                {921600, B921600},
#endif
#ifdef B1000000
                {1000000, B1000000},
#endif
#ifdef B1152000
                {1152000, B1152000},
#endif
#ifdef B1500000
                {1500000, B1500000},
#endif
#ifdef B2000000
                {2000000, B2000000},
#endif
#ifdef B2500000
                {2500000, B2500000},
#endif
#ifdef B3000000
                {3000000, B3000000},
#endif
#ifdef B3500000
                {3500000, B3500000},
#endif
#ifdef B4000000
                {4000000, B4000000},
#endif
            };
            return table;
        }
#endif

    } // namespace

    std::optional<BaudConstant> lookup_baud(int baud) {
        const auto& table = baud_table();
        auto it = table.find(baud);
        if (it == table.end()) {
            return std::nullopt;
        }
        return it->second;
    }

} // namespace serialio
