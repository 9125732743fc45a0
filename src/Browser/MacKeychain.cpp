/*
 * BrowserJar - Browser Cookie Extraction Engine
 * Copyright (C) 2026 BrowserJar Project
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "pch.h"
#include "MacKeychain.hpp"

#include "../Utils/Logger.hpp"

#ifdef __APPLE__
#  include <CoreFoundation/CoreFoundation.h>
#  include <Security/Security.h>
#endif

namespace BrowserJar {
namespace Browser {

#ifdef __APPLE__

namespace {

/// Releases a CoreFoundation object on scope exit
template <typename T>
struct CFRef {
    T ref = nullptr;
    ~CFRef() { if (ref) CFRelease(ref); }
    CFRef() = default;
    explicit CFRef(T r) : ref(r) {}
    CFRef(const CFRef&) = delete;
    CFRef& operator=(const CFRef&) = delete;
};

CFStringRef MakeCFString(std::string_view s) {
    return CFStringCreateWithBytes(kCFAllocatorDefault,
        reinterpret_cast<const UInt8*>(s.data()), static_cast<CFIndex>(s.size()),
        kCFStringEncodingUTF8, false);
}

}  // namespace

std::optional<std::string> FindKeychainPassword(std::string_view service, std::string_view account) {
    CFRef<CFStringRef> cfService(MakeCFString(service));
    CFRef<CFStringRef> cfAccount(MakeCFString(account));
    if (!cfService.ref || !cfAccount.ref) {
        BJ_LOG_WARN("Keychain", "Cannot build keychain query strings");
        return std::nullopt;
    }

    const void* keys[] = { kSecClass, kSecAttrService, kSecAttrAccount, kSecReturnData, kSecMatchLimit };
    const void* values[] = { kSecClassGenericPassword, cfService.ref, cfAccount.ref, kCFBooleanTrue, kSecMatchLimitOne };

    CFRef<CFDictionaryRef> query(CFDictionaryCreate(kCFAllocatorDefault, keys, values,
        sizeof(keys) / sizeof(keys[0]), &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks));
    if (!query.ref) {
        BJ_LOG_WARN("Keychain", "Cannot build keychain query");
        return std::nullopt;
    }

    CFTypeRef result = nullptr;
    const OSStatus status = SecItemCopyMatching(query.ref, &result);
    CFRef<CFTypeRef> owned(result);

    if (status != errSecSuccess) {
        BJ_LOG_WARN("Keychain", "Keychain lookup for \"%.*s\" failed (OSStatus %d)",
            static_cast<int>(service.size()), service.data(), static_cast<int>(status));
        return std::nullopt;
    }
    if (!result || CFGetTypeID(result) != CFDataGetTypeID()) {
        BJ_LOG_WARN("Keychain", "Keychain item has no password data");
        return std::nullopt;
    }

    const auto data = static_cast<CFDataRef>(result);
    return std::string(reinterpret_cast<const char*>(CFDataGetBytePtr(data)),
                       static_cast<size_t>(CFDataGetLength(data)));
}

#else

std::optional<std::string> FindKeychainPassword(std::string_view service, std::string_view account) {
    (void)account;
    BJ_LOG_DEBUG("Keychain", "Keychain is not available on this platform (\"%.*s\")",
        static_cast<int>(service.size()), service.data());
    return std::nullopt;
}

#endif

std::optional<std::string> FindSafeStoragePassword(std::string_view keyringName) {
    const std::string service = std::string(keyringName) + " Safe Storage";
    return FindKeychainPassword(service, keyringName);
}

}  // namespace Browser
}  // namespace BrowserJar
