/**
 * PlatformProbe.cpp - Status names shared by both platform implementations
 */

#include "PlatformProbe.h"

namespace UnifiedScan {

    const wchar_t* ToString(ProbeStatus status) {
        switch (status) {
        case ProbeStatus::OK:            return L"OK";
        case ProbeStatus::NOT_FOUND:     return L"not found";
        case ProbeStatus::ACCESS_DENIED: return L"access denied";
        case ProbeStatus::IN_USE:        return L"in use";
        case ProbeStatus::TIMED_OUT:     return L"timed out";
        case ProbeStatus::NOT_SUPPORTED: return L"not supported";
        case ProbeStatus::FAILURE:       return L"failed";
        }
        return L"unknown";
    }

    const wchar_t* ToString(RegistryHive hive) {
        return hive == RegistryHive::CURRENT_USER ? L"HKCU" : L"HKLM";
    }

} // namespace UnifiedScan
