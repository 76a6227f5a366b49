#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "component_registry.hpp"
#include "entropy_source.hpp"

namespace asftoken {
namespace test {

// First published vector: 27 zero characters, checksum 2MvMGi
constexpr const char* kZeroToken = "asf_sample_0000000000000000000000000002MvMGi";
// Second published vector: 27 'z' characters, checksum 13hv5A
constexpr const char* kZedToken = "asf_sample_zzzzzzzzzzzzzzzzzzzzzzzzzzz13hv5A";

/**
 * RAII wrapper for a temporary file.
 * Creates file on construction, deletes on destruction.
 */
class TempFile {
public:
    explicit TempFile(const std::string& content,
                      const std::string& filename = "temp_test.yaml")
        : path_(std::filesystem::temp_directory_path() / generateUniqueName(filename)) {
        std::ofstream file(path_);
        file << content;
        file.close();
    }

    ~TempFile() {
        if (std::filesystem::exists(path_)) {
            std::filesystem::remove(path_);
        }
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    std::string path() const { return path_.string(); }
    std::filesystem::path fsPath() const { return path_; }

private:
    std::filesystem::path path_;

    static std::string generateUniqueName(const std::string& base) {
        static std::random_device rd;
        static std::mt19937 gen(rd());
        static std::uniform_int_distribution<> dis(10000, 99999);

        auto stem = std::filesystem::path(base).stem().string();
        auto ext = std::filesystem::path(base).extension().string();
        return stem + "_" + std::to_string(dis(gen)) + ext;
    }
};

/**
 * Entropy source replaying a fixed byte pattern, cycling when exhausted.
 * Counts calls and bytes handed out so tests can assert consumption.
 */
class SequenceEntropySource : public EntropySource {
public:
    explicit SequenceEntropySource(std::vector<std::uint8_t> pattern)
        : pattern_(std::move(pattern)) {}

    Result<std::vector<std::uint8_t>> nextBytes(std::size_t count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        std::vector<std::uint8_t> bytes;
        bytes.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            bytes.push_back(pattern_[position_++ % pattern_.size()]);
        }
        bytes_served_ += count;
        return bytes;
    }

    std::size_t calls() const { return calls_; }
    std::size_t bytesServed() const { return bytes_served_; }

private:
    std::mutex mutex_;
    std::vector<std::uint8_t> pattern_;
    std::size_t position_ = 0;
    std::atomic<std::size_t> calls_{0};
    std::atomic<std::size_t> bytes_served_{0};
};

// Entropy source that always returns the same byte
inline std::shared_ptr<SequenceEntropySource> constantEntropy(std::uint8_t byte) {
    return std::make_shared<SequenceEntropySource>(std::vector<std::uint8_t>{byte});
}

class FailingEntropySource : public EntropySource {
public:
    Result<std::vector<std::uint8_t>> nextBytes(std::size_t) override {
        ++calls_;
        return Error::EntropyFailure("Entropy handle exhausted");
    }

    std::size_t calls() const { return calls_; }

private:
    std::atomic<std::size_t> calls_{0};
};

/**
 * Registry that records lookups and can simulate a backend outage.
 */
class CountingRegistry : public ComponentRegistry {
public:
    explicit CountingRegistry(std::set<std::string> components)
        : components_(std::move(components)) {}

    Result<bool> isAllocated(const std::string& component) const override {
        ++lookups_;
        if (unavailable_) {
            return Error::RegistryUnavailable("Registry backend unreachable", "connection refused");
        }
        return components_.count(component) > 0;
    }

    void setUnavailable(bool unavailable) { unavailable_ = unavailable; }
    std::size_t lookups() const { return lookups_; }

private:
    std::set<std::string> components_;
    std::atomic<bool> unavailable_{false};
    mutable std::atomic<std::size_t> lookups_{0};
};

inline std::shared_ptr<CountingRegistry> sampleRegistry() {
    return std::make_shared<CountingRegistry>(std::set<std::string>{"sample", "atr", "abc", "abcdef"});
}

} // namespace test
} // namespace asftoken
