#include <Textmode/common.hpp>

// Nothing in the kernel allocates, these only exist so the vtables link

extern "C" void __cxa_pure_virtual() {
    PANIC("Pure Virtual function called");
}

void operator delete(void* p){
    (void)p;
    PANIC("operator delete called without a heap");
}

void operator delete(void* p, long unsigned int size){
    (void)p;
    (void)size;
    PANIC("operator delete called without a heap");
}

// The compiler may emit calls to these for aggregate copies and zero-initialization

extern "C" void* memset(void* s, int c, size_t n) {
    uint8_t* buf = (uint8_t*)s;

    for(size_t i = 0; i < n; i++)
        buf[i] = (uint8_t)c;

    return s;
}

extern "C" void* memcpy(void* dst, const void* src, size_t n) {
    uint8_t* _dst = (uint8_t*)dst;
    const uint8_t* _src = (const uint8_t*)src;

    for(size_t i = 0; i < n; i++)
        _dst[i] = _src[i];
    
    return dst;
}
