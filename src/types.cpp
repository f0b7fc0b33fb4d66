/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "bootq/types.hpp"

namespace bootq {

namespace {
int hexValue(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
}

bool JobId::fromBytes(const std::string& raw, JobId& out) noexcept {
    if (raw.size() != kSize) {
        return false;
    }
    for (std::size_t i = 0; i < kSize; ++i) {
        out.bytes_[i] = static_cast<std::uint8_t>(raw[i]);
    }
    return true;
}

bool JobId::fromHex(const std::string& hex, JobId& out) noexcept {
    if (hex.size() != kSize * 2) {
        return false;
    }
    std::array<std::uint8_t, kSize> parsed{};
    for (std::size_t i = 0; i < kSize; ++i) {
        int hi = hexValue(hex[2 * i]);
        int lo = hexValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        parsed[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    out.bytes_ = parsed;
    return true;
}

std::string JobId::bytes() const {
    return std::string(bytes_.begin(), bytes_.end());
}

std::string JobId::hex() const {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(kSize * 2);
    for (std::uint8_t b : bytes_) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

bool JobId::empty() const noexcept {
    for (std::uint8_t b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

std::size_t JobIdHash::operator()(const JobId& id) const noexcept {
    // Ids are already uniformly distributed hashes; fold the leading bytes.
    std::size_t h = 0;
    const auto& raw = id.raw();
    for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
        h = (h << 8) | raw[i];
    }
    return h;
}

const char* errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::NotFound: return "not found";
        case ErrorCode::IoError: return "io error";
        case ErrorCode::DecodeError: return "decode error";
        case ErrorCode::ConversionError: return "conversion error";
        case ErrorCode::ExecutionError: return "execution error";
        default: return "unknown";
    }
}

}
