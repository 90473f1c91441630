#pragma once

#include <nrx/llm/device_info.hpp>
#include <nrx/llm/downloader.hpp>
#include <nrx/llm/foundation_bridge.hpp>
#include <nrx/llm/inference_runtime.hpp>
#include <nrx/llm/provider_manager.hpp>
#include <nrx/llm/unsupported_provider.hpp>
#include <nrx/util/logger.hpp>

#include <atomic>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace nrx::test {

constexpr uint64_t GB = 1024ULL * 1024ULL * 1024ULL;

// ============================================================================
// Logging
// ============================================================================

class RecordingLogger : public Logger {
public:
    RecordingLogger() { set_min_level(LogLevel::DEBUG); }

    void log(LogLevel level, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        lines.push_back(std::string(log_level_name(level)) + " " + message);
    }

    bool contains(const std::string& needle) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& line : lines) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    std::vector<std::string> lines;

private:
    std::mutex mutex_;
};

// ============================================================================
// Device info
// ============================================================================

class FakeDeviceInfo : public llm::DeviceInfoSource {
public:
    uint64_t memory = 8 * GB;
    std::vector<std::string> abis = {"arm64-v8a"};
    std::string device_model = "Pixel 8";
    std::string os = "android";
    std::string version = "14";
    bool fail = false;
    bool fail_with_code = false;  // throws a non-std value

    uint64_t total_memory_bytes() override {
        if (fail) throw std::runtime_error("sensor offline");
        if (fail_with_code) throw 42;
        return memory;
    }
    std::vector<std::string> supported_abis() override { return abis; }
    std::string model() override { return device_model; }
    std::string os_name() override { return os; }
    std::string os_version() override { return version; }
};

// ============================================================================
// Foundation bridge
// ============================================================================

struct FoundationCounters {
    int sessions_created = 0;
    int configure_calls = 0;
    int generate_calls = 0;
    int dispose_calls = 0;
    std::vector<std::string> instructions;
};

class FakeSession : public llm::FoundationSession {
public:
    FakeSession(FoundationCounters& counters, nlohmann::json reply,
                bool throw_on_dispose, bool throw_code_on_dispose)
        : counters_(counters)
        , reply_(std::move(reply))
        , throw_on_dispose_(throw_on_dispose)
        , throw_code_on_dispose_(throw_code_on_dispose) {}

    void configure(const std::string& instructions) override {
        counters_.configure_calls++;
        counters_.instructions.push_back(instructions);
    }

    nlohmann::json generate_text(const std::string&) override {
        counters_.generate_calls++;
        return reply_;
    }

    void dispose() override {
        counters_.dispose_calls++;
        if (throw_on_dispose_) throw std::runtime_error("dispose failed");
        if (throw_code_on_dispose_) throw 7;
    }

private:
    FoundationCounters& counters_;
    nlohmann::json reply_;
    bool throw_on_dispose_;
    bool throw_code_on_dispose_;
};

class FakeBridge : public llm::FoundationBridge {
public:
    std::string status = "available";
    bool throw_on_status = false;
    bool throw_on_create = false;
    bool throw_on_dispose = false;
    bool throw_code = false;  // status and dispose throw a non-std value
    nlohmann::json reply = "bridge reply";
    FoundationCounters counters;

    std::string foundation_models_status() override {
        if (throw_on_status) throw std::runtime_error("not supported on this OS");
        if (throw_code) throw -1;
        return status;
    }

    std::unique_ptr<llm::FoundationSession> create_session() override {
        if (throw_on_create) throw std::runtime_error("no session");
        counters.sessions_created++;
        return std::make_unique<FakeSession>(counters, reply, throw_on_dispose, throw_code);
    }
};

// ============================================================================
// Inference runtime
// ============================================================================

struct RuntimeCounters {
    int init_calls = 0;
    int clear_calls = 0;
    int completion_calls = 0;
    int release_calls = 0;
    std::vector<llm::RuntimeParams> init_params;
    std::vector<llm::CompletionParams> completions;
};

class FakeContext : public llm::InferenceContext {
public:
    FakeContext(RuntimeCounters& counters, std::optional<std::string> reply)
        : counters_(counters), reply_(std::move(reply)) {}

    Result<void> clear_cache(bool) override {
        counters_.clear_calls++;
        return {};
    }

    Result<llm::CompletionOutput> completion(const llm::CompletionParams& params,
                                             const llm::TokenCallback&) override {
        counters_.completion_calls++;
        counters_.completions.push_back(params);
        llm::CompletionOutput out;
        out.text = reply_;
        out.stop_reason = "eos";
        return out;
    }

    Result<void> release() override {
        counters_.release_calls++;
        return {};
    }

private:
    RuntimeCounters& counters_;
    std::optional<std::string> reply_;
};

class FakeRuntime : public llm::InferenceRuntime {
public:
    std::optional<std::string> reply = std::string("runtime reply");
    bool fail_init = false;
    RuntimeCounters counters;

    std::string name() const override { return "fake"; }

    Result<std::unique_ptr<llm::InferenceContext>> init(const llm::RuntimeParams& params) override {
        counters.init_calls++;
        counters.init_params.push_back(params);
        if (fail_init) {
            return Error(ErrorCode::INTERNAL_ERROR, "model load failed");
        }
        return std::unique_ptr<llm::InferenceContext>(
            std::make_unique<FakeContext>(counters, reply));
    }
};

// ============================================================================
// Downloader
// ============================================================================

/**
 * Writes `bytes` bytes to the destination. `during` runs after the file
 * is written, before returning, to let a test cancel mid-transfer.
 */
class FakeDownloader : public llm::Downloader {
public:
    uint64_t bytes = 0;
    bool throw_error = false;
    std::optional<Error> error;
    std::function<void()> during;
    int calls = 0;
    std::string last_url;

    Result<void> download(const std::string& url,
                          const fs::path& destination,
                          const std::atomic<bool>&) override {
        calls++;
        last_url = url;

        write_file(destination, bytes);
        if (during) during();

        if (throw_error) throw std::runtime_error("connection reset");
        if (error) return *error;
        return {};
    }

    static void write_file(const fs::path& path, uint64_t size) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (size > 0) {
            out.seekp(static_cast<std::streamoff>(size - 1));
            out.put('\0');
        }
    }
};

// ============================================================================
// Provider factory
// ============================================================================

// Provider whose availability and status are set by the test
class ScriptedProvider : public llm::LLMProvider {
public:
    ScriptedProvider(std::string name, bool available, bool platform_model = false)
        : name_(std::move(name)), available_(available), platform_model_(platform_model) {}

    llm::ProviderInfo info() const override {
        llm::ProviderInfo pinfo;
        pinfo.name = name_;
        pinfo.platform_model = platform_model_;
        return pinfo;
    }
    bool is_available() override { return available_; }
    Result<void> initialize(llm::ProgressCallback) override {
        status_ = llm::ProviderStatus::READY;
        return {};
    }
    Result<std::string> generate(const std::string&, const std::string& user) override {
        return "echo: " + user;
    }
    void cleanup() override {
        cleanups++;
        status_ = llm::ProviderStatus::UNINITIALIZED;
    }
    llm::ProviderStatus status() const override { return status_; }

    int cleanups = 0;

private:
    std::string name_;
    bool available_;
    bool platform_model_;
    llm::ProviderStatus status_ = llm::ProviderStatus::UNINITIALIZED;
};

class FakeProviderFactory : public llm::ProviderFactory {
public:
    bool foundation_available = true;
    bool local_available = true;
    bool throw_on_local = false;
    bool throw_code_on_local = false;
    std::vector<std::string> built;
    std::vector<std::string> local_tiers;

    llm::ProviderPtr make_foundation() override {
        built.push_back("foundation");
        return std::make_unique<ScriptedProvider>("apple-foundation", foundation_available, true);
    }

    llm::ProviderPtr make_local(const llm::ModelDefinition& model) override {
        built.push_back("local");
        local_tiers.push_back(model.tier);
        if (throw_on_local) throw std::runtime_error("factory failure");
        if (throw_code_on_local) throw 3;
        return std::make_unique<ScriptedProvider>("llama-" + model.tier, local_available);
    }

    llm::ProviderPtr make_unsupported() override {
        built.push_back("unsupported");
        return std::make_unique<llm::UnsupportedProvider>();
    }
};

}  // namespace nrx::test
