#ifndef BOARD_ENGINE_UTIL_H
#define BOARD_ENGINE_UTIL_H

#include <cstdint>
#include <cstddef>
#include <cstring>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
inline double boardNowMs() {
    return emscripten_get_now();
}
#else
#include <chrono>
// Native builds and tests use a steady clock in place of emscripten_get_now().
inline double boardNowMs() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}
#endif

static inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline float readF32(const std::uint8_t* src, std::size_t offset) noexcept {
    float v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline double readF64(const std::uint8_t* src, std::size_t offset) noexcept {
    double v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline void writeU32LE(std::uint8_t* dst, std::size_t offset, std::uint32_t v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

static inline void writeF32LE(std::uint8_t* dst, std::size_t offset, float v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

static inline void writeF64LE(std::uint8_t* dst, std::size_t offset, double v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

#endif // BOARD_ENGINE_UTIL_H
