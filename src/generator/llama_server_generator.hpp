#ifndef PROMPTGUARD_GENERATOR_LLAMA_SERVER_GENERATOR_HPP
#define PROMPTGUARD_GENERATOR_LLAMA_SERVER_GENERATOR_HPP

#include <string>
#include "generator.hpp"

/**
 * @file llama_server_generator.hpp
 * @brief Generator backed by a llama.cpp-style completion server, over libcurl.
 *
 * DESIGN:
 *   - POST {endpoint}/completion with the prompt wrapped in the Llama-2 chat
 *     template "[INST] ... [/INST]", plus top_p/top_k/repeat_penalty and the
 *     template's stop markers. The reply's "content" member is the completion.
 *   - An echoed prompt is stripped. A completion shorter than 10 characters is
 *     retried once with the "<s>[INST] ... [/INST]" variant; if the result is
 *     still empty a fixed fallback sentence is returned.
 *   - Transport errors, timeouts and non-200 replies throw core::GenerationError.
 *   - ready() checks GET {endpoint}/health.
 *
 * Thread-safety: every call uses its own curl easy handle; the global curl
 * init runs once per process.
 */

namespace promptguard {
namespace generator {

class LlamaServerGenerator : public Generator
{
public:
    static constexpr const char *kFallbackResponse =
        "I understand your question. Let me provide a response based on my training data.";

    /**
     * @param endpoint        base URL, e.g. "http://127.0.0.1:8080" (trailing '/' allowed)
     * @param timeoutSeconds  whole-request timeout, 0 = none
     */
    LlamaServerGenerator(std::string endpoint, unsigned timeoutSeconds);

    std::string generate(const std::string &prompt, int maxTokens, double temperature) override;

    bool ready() override;

    const std::string &endpoint() const { return endpoint_; }

    /// Request body for one completion call; exposed for tests.
    static std::string buildRequestBody(const std::string &formattedPrompt, int maxTokens, double temperature);

    /**
     * @brief Extract and tidy the completion from a server reply: trims it and
     *        removes a leading copy of @p formattedPrompt.
     * @throw core::GenerationError if the reply carries no "content" string.
     */
    static std::string parseCompletion(const std::string &responseBody, const std::string &formattedPrompt);

private:
    std::string endpoint_;
    unsigned timeoutSeconds_;

    std::string complete(const std::string &formattedPrompt, int maxTokens, double temperature);

    static void initCurl();
};

} // namespace generator
} // namespace promptguard

#endif // PROMPTGUARD_GENERATOR_LLAMA_SERVER_GENERATOR_HPP
