#include "llama_server_generator.hpp"

#include <curl/curl.h>
#include <mutex>
#include <optional>
#include <sstream>
#include "../core/errors.hpp"
#include "../service/json_codec.hpp"
#include "../util/logger.hpp"
#include "../util/text_utils.hpp"

namespace promptguard {
namespace generator {

namespace {

const size_t kMinimumUsefulLength = 10;

size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    if (!userdata) return 0;
    std::string &resp = *reinterpret_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    resp.append(ptr, total);
    return total;
}

std::string formatNumber(double value)
{
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // namespace

LlamaServerGenerator::LlamaServerGenerator(std::string endpoint, unsigned timeoutSeconds)
    : endpoint_(std::move(endpoint)), timeoutSeconds_(timeoutSeconds)
{
    while (!endpoint_.empty() && endpoint_.back() == '/') {
        endpoint_.pop_back();
    }
    if (endpoint_.empty()) {
        throw core::ConfigurationError("generatorEndpoint must not be empty");
    }
    initCurl();
}

void LlamaServerGenerator::initCurl()
{
    static bool initialized = false;
    static std::mutex initMutex;
    std::lock_guard<std::mutex> lock(initMutex);
    if (!initialized) {
        curl_global_init(CURL_GLOBAL_ALL);
        initialized = true;
    }
}

std::string LlamaServerGenerator::buildRequestBody(const std::string &formattedPrompt,
                                                   int maxTokens,
                                                   double temperature)
{
    std::string body = "{";
    body += "\"prompt\":\"" + service::escapeJson(formattedPrompt) + "\",";
    body += "\"n_predict\":" + std::to_string(maxTokens) + ",";
    body += "\"temperature\":" + formatNumber(temperature) + ",";
    body += "\"top_p\":0.9,";
    body += "\"top_k\":20,";
    body += "\"repeat_penalty\":1.05,";
    body += "\"stop\":[\"[INST]\",\"</s>\",\"<s>\"],";
    body += "\"stream\":false";
    body += "}";
    return body;
}

std::string LlamaServerGenerator::parseCompletion(const std::string &responseBody,
                                                  const std::string &formattedPrompt)
{
    std::optional<std::string> content;
    try {
        content = service::extractStringField(responseBody, "content");
    }
    catch (const std::exception &ex) {
        throw core::GenerationError(std::string("malformed completion reply: ") + ex.what());
    }
    if (!content) {
        throw core::GenerationError("completion reply has no \"content\" member");
    }
    std::string text = *content;
    util::text::trim(text);
    if (util::text::startsWith(text, formattedPrompt)) {
        text.erase(0, formattedPrompt.size());
        util::text::trim(text);
    }
    return text;
}

std::string LlamaServerGenerator::complete(const std::string &formattedPrompt,
                                           int maxTokens,
                                           double temperature)
{
    CURL *curl = curl_easy_init();
    if (!curl) {
        throw core::GenerationError("curl_easy_init failed");
    }

    const std::string url = endpoint_ + "/completion";
    const std::string body = buildRequestBody(formattedPrompt, maxTokens, temperature);
    std::string responseBody;

    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Expect:");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeoutSeconds_));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw core::GenerationError("completion request to " + url + " failed: "
                                    + std::string(curl_easy_strerror(res)));
    }
    if (status != 200) {
        throw core::GenerationError("completion server returned HTTP " + std::to_string(status));
    }
    return parseCompletion(responseBody, formattedPrompt);
}

std::string LlamaServerGenerator::generate(const std::string &prompt, int maxTokens, double temperature)
{
    const std::string formatted = "[INST] " + prompt + " [/INST]";
    util::logger::debug("[LlamaServerGenerator] generating for: " + util::logger::preview(prompt));

    std::string text = complete(formatted, maxTokens, temperature);
    if (text.size() < kMinimumUsefulLength) {
        util::logger::warn("[LlamaServerGenerator] short completion (" + std::to_string(text.size())
                           + " chars), retrying with BOS prefix");
        const std::string alternative = "<s>[INST] " + prompt + " [/INST]";
        text = complete(alternative, maxTokens, temperature);
    }
    if (text.empty()) {
        util::logger::warn("[LlamaServerGenerator] empty completion, using fallback response");
        return kFallbackResponse;
    }
    return text;
}

bool LlamaServerGenerator::ready()
{
    CURL *curl = curl_easy_init();
    if (!curl) {
        return false;
    }
    const std::string url = endpoint_ + "/health";
    std::string responseBody;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 5L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        util::logger::debug("[LlamaServerGenerator] health check failed: "
                            + std::string(curl_easy_strerror(res)));
        return false;
    }
    return status == 200;
}

} // namespace generator
} // namespace promptguard
