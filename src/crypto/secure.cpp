// LUMENCRYPT - Secure Memory Helpers Implementation
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include "lumencrypt/crypto/secure.h"

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/mman.h>
#endif

namespace lumencrypt {

void SecureZero(void* ptr, size_t size) {
    if (ptr == nullptr) return;
    volatile Byte* p = static_cast<volatile Byte*>(ptr);
    while (size--) {
        *p++ = 0;
    }
}

bool LockMemory(void* ptr, size_t size) {
#ifdef _WIN32
    return VirtualLock(ptr, size) != 0;
#else
    return mlock(ptr, size) == 0;
#endif
}

bool UnlockMemory(void* ptr, size_t size) {
#ifdef _WIN32
    return VirtualUnlock(ptr, size) != 0;
#else
    return munlock(ptr, size) == 0;
#endif
}

} // namespace lumencrypt
