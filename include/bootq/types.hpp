#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace bootq {

// Fixed-width content identifier of a job (hash of its bytes).
class JobId {
public:
    static constexpr std::size_t kSize = 32;

    JobId() noexcept { bytes_.fill(0); }
    explicit JobId(const std::array<std::uint8_t, kSize>& bytes) noexcept : bytes_(bytes) {}

    // Returns false and leaves `out` untouched when `raw` is not exactly kSize bytes.
    [[nodiscard]] static bool fromBytes(const std::string& raw, JobId& out) noexcept;
    [[nodiscard]] static bool fromHex(const std::string& hex, JobId& out) noexcept;

    [[nodiscard]] std::string bytes() const;
    [[nodiscard]] std::string hex() const;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] const std::array<std::uint8_t, kSize>& raw() const noexcept { return bytes_; }

    bool operator==(const JobId& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const JobId& other) const noexcept { return bytes_ != other.bytes_; }
    bool operator<(const JobId& other) const noexcept { return bytes_ < other.bytes_; }

private:
    std::array<std::uint8_t, kSize> bytes_;
};

struct JobIdHash {
    std::size_t operator()(const JobId& id) const noexcept;
};

enum class ErrorCode : std::uint8_t {
    None = 0,
    NotFound,
    IoError,
    DecodeError,
    ConversionError,
    ExecutionError
};

[[nodiscard]] const char* errorCodeToString(ErrorCode code) noexcept;

struct Result {
    bool ok = true;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }

    static Result success() { return {}; }
    static Result failure(ErrorCode code, std::string msg) { return {false, code, std::move(msg)}; }
};

struct ReadResult {
    bool ok = false;
    std::string value;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct HasResult {
    bool ok = false;
    bool value = false;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct CountResult {
    bool ok = false;
    std::uint64_t value = 0;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct IdListResult {
    bool ok = false;
    std::vector<JobId> ids;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class Job;

struct JobResult {
    bool ok = false;
    std::shared_ptr<Job> job;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

} // namespace bootq
