/**
 * @file key_generator.cpp
 * @brief Timestamp and random-suffix key prefix generation
 *
 * @date 2025
 */

#include "stratus/core/key_generator.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace stratus {
namespace core {

const char* const kMaxExecOutputSizeStr = "10 MiB";
const char* const kMaxReadFileSizeStr = "100 MiB";

namespace {

const char kAlphabet[] =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

constexpr std::size_t kSuffixLength = 8;

} // anonymous namespace

std::string OperationToString(Operation operation) {
    switch (operation) {
        case Operation::EXEC: return "exec";
        case Operation::READ_FILE: return "read_file";
        case Operation::WRITE_FILE: return "write_file";
        default: return "exec";
    }
}

KeyGenerator::KeyGenerator(std::string base_prefix)
    : base_prefix_(std::move(base_prefix))
    , clock_([] { return std::chrono::system_clock::now(); })
    , engine_(std::random_device{}()) {
}

KeyGenerator::KeyGenerator(std::string base_prefix, std::uint32_t seed, WallClock clock)
    : base_prefix_(std::move(base_prefix))
    , clock_(std::move(clock))
    , engine_(seed) {
}

std::string KeyGenerator::Prefix(Operation operation) {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_prefix_ + OperationToString(operation) + "/" +
           FormatTimestamp(clock_()) + "-" + RandomSuffix() + "/";
}

std::string KeyGenerator::FormatTimestamp(std::chrono::system_clock::time_point time) {
    auto seconds = std::chrono::system_clock::to_time_t(time);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        time.time_since_epoch()).count() % 1000000;
    if (micros < 0) {
        micros += 1000000;
    }

    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

std::string KeyGenerator::RandomSuffix() {
    std::uniform_int_distribution<std::size_t> dis(0, sizeof(kAlphabet) - 2);
    std::string suffix;
    suffix.reserve(kSuffixLength);
    for (std::size_t i = 0; i < kSuffixLength; ++i) {
        suffix += kAlphabet[dis(engine_)];
    }
    return suffix;
}

} // namespace core
} // namespace stratus
