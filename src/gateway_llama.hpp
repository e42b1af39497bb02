#pragma once

#include "gateway.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

struct llama_model;
struct llama_context;
struct llama_sampler;
struct llama_vocab;

namespace code_mt {

struct LlamaGatewayConfig {
    std::string model_path;
    int n_ctx = 4096;
    int n_gpu_layers = -1;
    int n_threads = 8;
    int max_tokens = 2048;
    float temperature = 0.0f;
};

// Local-model gateway on llama.cpp. The model is loaded once and shared by all
// clones; every clone owns its own context and sampler.
class LlamaGateway final : public TranslationGateway {
public:
    explicit LlamaGateway(LlamaGatewayConfig config);
    ~LlamaGateway() override;

    LlamaGateway(const LlamaGateway&) = delete;
    LlamaGateway& operator=(const LlamaGateway&) = delete;

    std::unique_ptr<TranslationGateway> clone() const override;
    std::vector<std::string> translate(const TranslationRequest& request) override;

    // *.gguf files directly under `dir`, sorted.
    static std::vector<std::filesystem::path> list_models(const std::filesystem::path& dir);

private:
    struct SharedModel;

    LlamaGateway(LlamaGatewayConfig config, std::shared_ptr<SharedModel> shared_model);

    static std::shared_ptr<SharedModel> load_shared_model(const LlamaGatewayConfig& config);
    static bool abort_requested(void* data);

    std::string build_prompt(const TranslationRequest& request) const;
    std::string generate(const std::string& prompt);
    std::string postprocess_translation(std::string text) const;

    std::vector<int32_t> tokenize(const std::string& text, bool add_special, bool parse_special) const;
    std::string token_to_piece(int32_t token) const;

    void ensure_context_ready();
    bool past_deadline() const;
    void fail_decode(const char* what) const;

    LlamaGatewayConfig config_;
    std::shared_ptr<SharedModel> shared_model_;

    llama_context* ctx_ = nullptr;
    llama_sampler* sampler_ = nullptr;

    bool deadline_armed_ = false;
    std::chrono::steady_clock::time_point deadline_{};
};

}  // namespace code_mt
