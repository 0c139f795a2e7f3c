//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpengine/sampling/LocalModelSamplingProvider.cpp
// Purpose: Chat-completions sampling provider using Boost.Beast
//==========================================================================================================

#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpengine/sampling/LocalModelSamplingProvider.hpp"

namespace mcpengine {
namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

struct Endpoint {
    std::string host;
    std::string port{"80"};
    std::string target;
};

// http://host[:port][/prefix] + path
Endpoint parseEndpoint(const SamplingConfig& config) {
    const std::string& url = config.baseUrl;
    const std::string scheme = "http://";
    if (url.rfind("https://", 0) == 0) {
        throw std::runtime_error("https endpoints are not supported: " + url);
    }
    if (url.rfind(scheme, 0) != 0) {
        throw std::runtime_error("Invalid sampling base URL: " + url);
    }
    std::string rest = url.substr(scheme.size());
    std::string prefix;
    if (auto slash = rest.find('/'); slash != std::string::npos) {
        prefix = rest.substr(slash);
        rest = rest.substr(0, slash);
    }
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    Endpoint ep;
    if (auto colon = rest.rfind(':'); colon != std::string::npos) {
        ep.host = rest.substr(0, colon);
        ep.port = rest.substr(colon + 1);
    } else {
        ep.host = rest;
    }
    if (ep.host.empty() || ep.port.empty()) {
        throw std::runtime_error("Invalid sampling base URL: " + url);
    }
    ep.target = prefix + config.path;
    if (ep.target.empty() || ep.target.front() != '/') {
        ep.target.insert(ep.target.begin(), '/');
    }
    return ep;
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

const std::string* stringMember(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = obj.find(key);
    if (v == nullptr || !v->isString()) {
        return nullptr;
    }
    return &std::get<std::string>(v->value);
}

std::string contentText(const JSONValue* content) {
    if (content == nullptr || content->isNull()) {
        return std::string();
    }
    if (content->isString()) {
        return std::get<std::string>(content->value);
    }
    if (content->isArray()) {
        std::string joined;
        for (const auto& part : std::get<JSONValue::Array>(content->value)) {
            if (part && part->isObject()) {
                if (const std::string* text = stringMember(*part, "text")) {
                    joined += *text;
                }
            }
        }
        return joined;
    }
    return SerializeJSON(*content);
}

} // namespace

///////////////////////////////////////// SamplingConfig /////////////////////////////////////////
SamplingConfig SamplingConfig::FromEnvironment() {
    SamplingConfig config;
    config.baseUrl = GetEnvOrDefault("MCPENGINE_SAMPLING_BASE_URL", config.baseUrl);
    config.path = GetEnvOrDefault("MCPENGINE_SAMPLING_PATH", config.path);
    config.modelName = GetEnvOrDefault("MCPENGINE_SAMPLING_MODEL", config.modelName);
    const std::string temperature = GetEnvOrDefault("MCPENGINE_SAMPLING_TEMPERATURE", "");
    if (!temperature.empty()) {
        char* end = nullptr;
        const double parsed = std::strtod(temperature.c_str(), &end);
        if (end != nullptr && *end == '\0') {
            config.temperature = parsed;
        }
    }
    config.maxTokens = GetEnvInt("MCPENGINE_SAMPLING_MAX_TOKENS", config.maxTokens);
    const long long timeoutMs = GetEnvInt("MCPENGINE_SAMPLING_TIMEOUT_MS", config.timeout.count());
    if (timeoutMs > 0) {
        config.timeout = std::chrono::milliseconds(timeoutMs);
    }
    return config;
}

//==========================================================================================================
// LocalModelSamplingProvider::Impl
// Purpose: io_context and its thread; one coroutine per request.
//==========================================================================================================
class LocalModelSamplingProvider::Impl {
public:
    SamplingConfig config;
    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;

    explicit Impl(SamplingConfig cfg) : config(std::move(cfg)) {
        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([this]() { ioc.run(); });
    }

    ~Impl() {
        workGuard.reset();
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    // Coroutine: POST JSON and return the response body; HTTP status >= 400 is an error.
    net::awaitable<std::string> coPostJson(Endpoint ep, std::string body, std::chrono::milliseconds timeout) {
        http::request<http::string_body> req{http::verb::post, ep.target, 11};
        req.set(http::field::host, ep.host);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        req.body() = std::move(body);
        req.prepare_payload();

        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(ep.host, ep.port, net::use_awaitable);

        boost::beast::tcp_stream stream(co_await net::this_coro::executor);
        stream.expires_after(timeout);
        co_await stream.async_connect(results, net::use_awaitable);

        stream.expires_after(timeout);
        co_await http::async_write(stream, req, net::use_awaitable);
        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);

        if (res.result_int() >= 400) {
            throw std::runtime_error("HTTP " + std::to_string(res.result_int()) + ": " + res.body());
        }
        co_return res.body();
    }
};

///////////////////////////////////////// LocalModelSamplingProvider /////////////////////////////////////////
LocalModelSamplingProvider::LocalModelSamplingProvider(SamplingConfig config)
    : pImpl(std::make_unique<Impl>(std::move(config))) {}

LocalModelSamplingProvider::~LocalModelSamplingProvider() = default;

const SamplingConfig& LocalModelSamplingProvider::GetConfig() const {
    return pImpl->config;
}

std::future<GenerationResponse> LocalModelSamplingProvider::CreateMessage(const GenerationRequest& request) {
    auto promise = std::make_shared<std::promise<GenerationResponse>>();
    auto fut = promise->get_future();
    const SamplingConfig& config = pImpl->config;

    Endpoint ep;
    try {
        ep = parseEndpoint(config);
    } catch (const std::exception& e) {
        LOG_WARN("Local model sampling failed: {}", e.what());
        promise->set_value(ErrorResponse(config, e.what()));
        return fut;
    }
    const std::string payload = SerializeJSON(BuildPayload(config, request));
    LOG_DEBUG("Submitting sampling request to {}:{}{}: {}", ep.host, ep.port, ep.target, payload);

    net::co_spawn(pImpl->ioc, pImpl->coPostJson(ep, payload, config.timeout),
        [config, promise](std::exception_ptr eptr, std::string body) {
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& e) {
                    LOG_WARN("Local model sampling failed: {}", e.what());
                    promise->set_value(ErrorResponse(config, e.what()));
                }
                return;
            }
            LOG_DEBUG("Received sampling response: {}", body);
            try {
                promise->set_value(ParseResponse(config, ParseJSON(body)));
            } catch (const std::exception& e) {
                LOG_WARN("Local model sampling returned an unreadable body: {}", e.what());
                promise->set_value(ErrorResponse(config, e.what()));
            }
        });
    return fut;
}

JSONValue LocalModelSamplingProvider::BuildPayload(const SamplingConfig& config, const GenerationRequest& request) {
    auto message = [](const std::string& role, const std::string& content) {
        JSONValue::Object m;
        m["role"] = std::make_shared<JSONValue>(role);
        m["content"] = std::make_shared<JSONValue>(content);
        return std::make_shared<JSONValue>(std::move(m));
    };

    JSONValue::Array messages;
    if (request.systemPrompt.has_value() && !request.systemPrompt->empty()) {
        messages.push_back(message("system", request.systemPrompt.value()));
    }
    for (const auto& m : request.messages) {
        messages.push_back(message(m.role, m.content.text.value_or("")));
    }

    JSONValue::Object payload;
    payload["model"] = std::make_shared<JSONValue>(config.modelName);
    payload["messages"] = std::make_shared<JSONValue>(std::move(messages));
    payload["temperature"] = std::make_shared<JSONValue>(config.temperature);
    const int64_t maxTokens = (request.maxTokens.has_value() && request.maxTokens.value() > 0)
                                  ? request.maxTokens.value()
                                  : config.maxTokens;
    payload["max_tokens"] = std::make_shared<JSONValue>(maxTokens);
    payload["stream"] = std::make_shared<JSONValue>(false);
    return JSONValue{std::move(payload)};
}

GenerationResponse LocalModelSamplingProvider::ParseResponse(const SamplingConfig& config, const JSONValue& reply) {
    const JSONValue* choice = nullptr;
    if (reply.isObject()) {
        if (const JSONValue* choices = reply.find("choices")) {
            if (choices->isArray() && !std::get<JSONValue::Array>(choices->value).empty()) {
                choice = std::get<JSONValue::Array>(choices->value).front().get();
            }
        } else if (reply.find("content") != nullptr) {
            choice = &reply;
        }
    }
    if (choice == nullptr || !choice->isObject()) {
        return ErrorResponse(config, "Invalid response payload");
    }

    const JSONValue* message = choice->find("message");
    if (message == nullptr || !message->isObject()) {
        message = choice;
    }

    GenerationResponse response;
    if (const std::string* role = stringMember(*message, "role")) {
        response.role = *role;
    }
    response.content = ContentBlock::Text(trim(contentText(message->find("content"))));

    if (const std::string* reason = stringMember(*choice, "finish_reason")) {
        response.stopReason = *reason;
    } else if (const std::string* stop = stringMember(*choice, "stopReason")) {
        response.stopReason = *stop;
    }

    if (const std::string* model = stringMember(reply, "model"); model && !model->empty()) {
        response.model = *model;
    } else if (const std::string* choiceModel = stringMember(*choice, "model"); choiceModel && !choiceModel->empty()) {
        response.model = *choiceModel;
    } else {
        response.model = config.modelName;
    }
    return response;
}

GenerationResponse LocalModelSamplingProvider::ErrorResponse(const SamplingConfig& config, const std::string& reason) {
    GenerationResponse response;
    response.role = "assistant";
    response.content = ContentBlock::Text("[sampling error] " + reason);
    response.model = config.modelName;
    response.stopReason = "error";
    return response;
}

} // namespace mcpengine
