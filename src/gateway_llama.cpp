#include "gateway_llama.hpp"

#include "chunker.hpp"

#include <llama.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
#include <utility>

namespace code_mt {

namespace {

std::once_flag g_backend_once;

void llama_log_quiet(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (level == GGML_LOG_LEVEL_ERROR && text != nullptr) {
        std::fputs(text, stderr);
    }
}

void initialize_backend_once() {
    std::call_once(g_backend_once, []() {
        llama_log_set(llama_log_quiet, nullptr);
        ggml_backend_load_all();
        llama_backend_init();
    });
}

std::string trim(std::string s) {
    auto is_ws = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_ws(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && is_ws(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }

    return s;
}

const char* kind_phrase(SpanKind kind) {
    switch (kind) {
    case SpanKind::LineComment:
    case SpanKind::BlockComment:
        return "source code comments";
    case SpanKind::Docstring:
        return "source code documentation comments";
    case SpanKind::StringLiteral:
        return "string literals from source code";
    }
    return "source code text";
}

}  // namespace

struct LlamaGateway::SharedModel {
    explicit SharedModel(const LlamaGatewayConfig& config) {
        initialize_backend_once();

        llama_model_params params = llama_model_default_params();
        params.n_gpu_layers = config.n_gpu_layers;
        params.main_gpu = 0;
        params.use_mmap = true;

        model = llama_model_load_from_file(config.model_path.c_str(), params);
        if (model == nullptr) {
            throw std::runtime_error("llama_model_load_from_file failed for: " + config.model_path);
        }

        vocab = llama_model_get_vocab(model);
        if (vocab == nullptr) {
            throw std::runtime_error("llama_model_get_vocab returned null");
        }
    }

    ~SharedModel() {
        if (model != nullptr) {
            llama_model_free(model);
            model = nullptr;
            vocab = nullptr;
        }
    }

    llama_model* model = nullptr;
    const llama_vocab* vocab = nullptr;
};

LlamaGateway::LlamaGateway(LlamaGatewayConfig config)
    : config_(std::move(config)), shared_model_(load_shared_model(config_)) {}

LlamaGateway::LlamaGateway(LlamaGatewayConfig config, std::shared_ptr<SharedModel> shared_model)
    : config_(std::move(config)), shared_model_(std::move(shared_model)) {}

LlamaGateway::~LlamaGateway() {
    if (sampler_ != nullptr) {
        llama_sampler_free(sampler_);
        sampler_ = nullptr;
    }

    if (ctx_ != nullptr) {
        llama_free(ctx_);
        ctx_ = nullptr;
    }
}

std::shared_ptr<LlamaGateway::SharedModel> LlamaGateway::load_shared_model(const LlamaGatewayConfig& config) {
    return std::make_shared<SharedModel>(config);
}

bool LlamaGateway::abort_requested(void* data) {
    return static_cast<const LlamaGateway*>(data)->past_deadline();
}

bool LlamaGateway::past_deadline() const {
    return deadline_armed_ && std::chrono::steady_clock::now() >= deadline_;
}

void LlamaGateway::fail_decode(const char* what) const {
    if (past_deadline()) {
        throw GatewayError(GatewayErrorKind::Timeout, std::string(what) + ": request timed out");
    }
    throw GatewayError(GatewayErrorKind::Unavailable, what);
}

void LlamaGateway::ensure_context_ready() {
    if (ctx_ != nullptr && sampler_ != nullptr) {
        return;
    }

    llama_context_params params = llama_context_default_params();
    params.n_ctx = static_cast<uint32_t>(std::max(512, config_.n_ctx));
    params.n_batch = params.n_ctx;
    params.n_ubatch = params.n_ctx;
    params.n_threads = std::max(1, config_.n_threads);
    params.n_threads_batch = std::max(1, config_.n_threads);
    params.offload_kqv = true;
    params.flash_attn_type = LLAMA_FLASH_ATTN_TYPE_AUTO;
    params.no_perf = true;
    params.abort_callback = &LlamaGateway::abort_requested;
    params.abort_callback_data = this;

    ctx_ = llama_init_from_model(shared_model_->model, params);
    if (ctx_ == nullptr) {
        throw GatewayError(GatewayErrorKind::Unavailable, "llama_init_from_model failed");
    }

    auto sparams = llama_sampler_chain_default_params();
    sparams.no_perf = true;
    sampler_ = llama_sampler_chain_init(sparams);
    if (sampler_ == nullptr) {
        throw GatewayError(GatewayErrorKind::Unavailable, "llama_sampler_chain_init failed");
    }

    if (config_.temperature > 0.0f) {
        llama_sampler_chain_add(sampler_, llama_sampler_init_temp(config_.temperature));
        llama_sampler_chain_add(sampler_, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    } else {
        llama_sampler_chain_add(sampler_, llama_sampler_init_greedy());
    }
}

std::unique_ptr<TranslationGateway> LlamaGateway::clone() const {
    return std::unique_ptr<TranslationGateway>(new LlamaGateway(config_, shared_model_));
}

std::vector<std::filesystem::path> LlamaGateway::list_models(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> out;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file(ec) && entry.path().extension() == ".gguf") {
            out.push_back(entry.path());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<int32_t> LlamaGateway::tokenize(const std::string& text, bool add_special, bool parse_special) const {
    const int32_t required = -llama_tokenize(
        shared_model_->vocab,
        text.c_str(),
        static_cast<int32_t>(text.size()),
        nullptr,
        0,
        add_special,
        parse_special
    );

    if (required <= 0) {
        throw GatewayError(GatewayErrorKind::Unsupported, "llama_tokenize failed while querying required token count");
    }

    std::vector<llama_token> tokens(static_cast<std::size_t>(required));
    const int32_t written = llama_tokenize(
        shared_model_->vocab,
        text.c_str(),
        static_cast<int32_t>(text.size()),
        tokens.data(),
        static_cast<int32_t>(tokens.size()),
        add_special,
        parse_special
    );

    if (written < 0) {
        throw GatewayError(GatewayErrorKind::Unsupported, "llama_tokenize failed while writing tokens");
    }

    tokens.resize(static_cast<std::size_t>(written));
    return std::vector<int32_t>(tokens.begin(), tokens.end());
}

std::string LlamaGateway::token_to_piece(int32_t token) const {
    char local[256];
    const int first = llama_token_to_piece(
        shared_model_->vocab,
        static_cast<llama_token>(token),
        local,
        static_cast<int32_t>(sizeof(local)),
        0,
        true
    );

    if (first >= 0) {
        return std::string(local, static_cast<std::size_t>(first));
    }

    std::vector<char> dynamic(static_cast<std::size_t>(-first));
    const int second = llama_token_to_piece(
        shared_model_->vocab,
        static_cast<llama_token>(token),
        dynamic.data(),
        static_cast<int32_t>(dynamic.size()),
        0,
        true
    );

    if (second < 0) {
        throw GatewayError(GatewayErrorKind::Protocol, "llama_token_to_piece failed");
    }

    return std::string(dynamic.data(), static_cast<std::size_t>(second));
}

std::string LlamaGateway::build_prompt(const TranslationRequest& request) const {
    std::string prompt;
    prompt += "Translate the following ";
    prompt += kind_phrase(request.kind);
    prompt += " from " + request.source_lang + " into " + request.target_lang + ".\n";
    if (request.texts.size() > 1) {
        prompt += "The parts are separated by lines containing only <|span|>. "
                  "Keep every separator line and the number of parts unchanged.\n";
    }
    prompt += "Preserve line breaks, indentation and comment decorations. "
              "Leave code identifiers and URLs as they are.\n"
              "Output the translation only. Do not explain.\n\n";
    prompt += join_chunk_text(request.texts);
    prompt += "\n\nTranslation:\n";
    return prompt;
}

std::string LlamaGateway::postprocess_translation(std::string text) const {
    text.erase(std::remove(text.begin(), text.end(), '\r'), text.end());

    const std::string marker = "Translation:";
    if (text.starts_with(marker)) {
        text = text.substr(marker.size());
    }

    return trim(std::move(text));
}

std::string LlamaGateway::generate(const std::string& prompt) {
    ensure_context_ready();

    llama_memory_clear(llama_get_memory(ctx_), true);
    llama_sampler_reset(sampler_);

    const std::vector<int32_t> prompt_tokens_i32 = tokenize(prompt, true, true);
    if (prompt_tokens_i32.empty()) {
        throw GatewayError(GatewayErrorKind::Unsupported, "Prompt tokenization produced no tokens");
    }

    std::vector<llama_token> prompt_tokens(prompt_tokens_i32.begin(), prompt_tokens_i32.end());
    const int max_tokens = std::max(1, config_.max_tokens);

    const uint32_t n_ctx_actual = llama_n_ctx(ctx_);
    if (prompt_tokens.size() + static_cast<std::size_t>(max_tokens) >= n_ctx_actual) {
        throw GatewayError(
            GatewayErrorKind::Unsupported,
            "Prompt too long for context window (prompt_tokens=" + std::to_string(prompt_tokens.size()) +
                ", n_ctx=" + std::to_string(n_ctx_actual) + ")"
        );
    }

    std::string generated;

    if (llama_model_has_encoder(shared_model_->model)) {
        llama_batch enc_batch = llama_batch_get_one(prompt_tokens.data(), static_cast<int32_t>(prompt_tokens.size()));
        if (llama_encode(ctx_, enc_batch) != 0) {
            fail_decode("llama_encode failed");
        }

        llama_token decoder_start = llama_model_decoder_start_token(shared_model_->model);
        if (decoder_start == LLAMA_TOKEN_NULL) {
            decoder_start = llama_vocab_bos(shared_model_->vocab);
        }

        llama_batch dec_batch = llama_batch_get_one(&decoder_start, 1);
        llama_token tok = decoder_start;

        for (int i = 0; i < max_tokens; ++i) {
            if (llama_decode(ctx_, dec_batch) != 0) {
                fail_decode("llama_decode failed during encoder-decoder generation");
            }

            tok = llama_sampler_sample(sampler_, ctx_, -1);
            if (llama_vocab_is_eog(shared_model_->vocab, tok)) {
                break;
            }

            generated += token_to_piece(tok);
            if (past_deadline()) {
                fail_decode("generation stopped");
            }
            dec_batch = llama_batch_get_one(&tok, 1);
        }

        return postprocess_translation(std::move(generated));
    }

    llama_batch batch = llama_batch_get_one(prompt_tokens.data(), static_cast<int32_t>(prompt_tokens.size()));
    if (llama_decode(ctx_, batch) != 0) {
        fail_decode("llama_decode failed for prompt");
    }

    for (int i = 0; i < max_tokens; ++i) {
        llama_token tok = llama_sampler_sample(sampler_, ctx_, -1);
        if (llama_vocab_is_eog(shared_model_->vocab, tok)) {
            break;
        }

        generated += token_to_piece(tok);
        if (past_deadline()) {
            fail_decode("generation stopped");
        }

        if (i + 1 >= max_tokens) {
            break;
        }

        batch = llama_batch_get_one(&tok, 1);
        if (llama_decode(ctx_, batch) != 0) {
            fail_decode("llama_decode failed for continuation token");
        }
    }

    return postprocess_translation(std::move(generated));
}

std::vector<std::string> LlamaGateway::translate(const TranslationRequest& request) {
    if (request.source_lang.empty() || request.target_lang.empty()) {
        throw GatewayError(GatewayErrorKind::Unsupported, "source and target language are required");
    }
    if (request.texts.empty()) {
        return {};
    }

    deadline_armed_ = request.timeout.count() > 0;
    deadline_ = std::chrono::steady_clock::now() + request.timeout;

    std::string output;
    try {
        output = generate(build_prompt(request));
    } catch (...) {
        deadline_armed_ = false;
        throw;
    }
    deadline_armed_ = false;

    if (request.texts.size() == 1) {
        return {output};
    }

    std::vector<std::string> pieces;
    std::string error;
    if (!split_chunk_text(output, request.texts.size(), pieces, error)) {
        throw GatewayError(GatewayErrorKind::Protocol, error);
    }
    return pieces;
}

}  // namespace code_mt
