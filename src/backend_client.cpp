#include "backend_client.h"
#include "logger.h"
#include "utils.h"
#include <curl/curl.h>
#include <sstream>

using json = nlohmann::json;

namespace wayfarer {

namespace {

std::string string_field(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

} // namespace

std::optional<VisualUpdate> visual_update_for(const BackendResult& result) {
    if (result.has_flights()) {
        return VisualUpdate{ViewMode::Flights, result.flights};
    }
    if (result.has_hotels()) {
        return VisualUpdate{ViewMode::Hotels, result.hotels};
    }
    if (result.has_booking()) {
        ViewMode mode = result.booking.contains("airline") ? ViewMode::FlightBooking : ViewMode::HotelBooking;
        return VisualUpdate{mode, json::array({result.booking})};
    }
    return std::nullopt;
}

Result<BackendResult> parse_backend_response(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        return make_parse_error("JSON parse error: " + std::string(e.what()));
    }
    if (!j.is_object()) {
        return make_parse_error("Backend response is not a JSON object");
    }

    BackendResult result;
    result.reply = string_field(j, "reply");
    result.intent = string_field(j, "intent");
    if (j.contains("slots") && j["slots"].is_object()) {
        result.slots = j["slots"];
    }
    if (j.contains("flights") && j["flights"].is_array()) {
        result.flights = j["flights"];
    }
    if (j.contains("hotels") && j["hotels"].is_array()) {
        result.hotels = j["hotels"];
    }
    if (j.contains("booking") && j["booking"].is_object()) {
        result.booking = j["booking"];
    }
    return result;
}

class BackendDispatchClient::Impl {
public:
    explicit Impl(const BackendConfig& config) : config_(config) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~Impl() {
        curl_global_cleanup();
    }

    Result<BackendResult> dispatch(const std::string& session_id, const std::string& text) {
        json request;
        request["session_id"] = session_id;
        request["user_text"] = text;
        std::string request_json = request.dump();
        std::string endpoint = config_.chat_endpoint();

        LOG_BACKEND("POST " + endpoint + " text=\"" + utils::preview(text) + "\"");
        auto start_time = Clock::now();

        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_backend_error("Failed to initialize CURL");
        }

        std::string response_buffer;
        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");

        curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_json.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout_ms));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl);
        long status = 0;
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        }

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            return make_backend_error(std::string("Backend request failed: ") + curl_easy_strerror(res));
        }

        std::ostringstream oss;
        oss << "HTTP " << status << " in " << ms_since(start_time) << "ms";
        LOG_BACKEND(oss.str());

        if (status < 200 || status >= 300) {
            return make_backend_error("Backend returned HTTP " + std::to_string(status));
        }

        auto parsed = parse_backend_response(response_buffer);
        if (parsed.is_error()) {
            LOG_BACKEND("Response body: " + utils::preview(response_buffer, 200));
            return make_backend_error("Malformed backend response: " + parsed.error().message);
        }

        const auto& result = parsed.value();
        LOG_BACKEND("intent=" + result.intent + " reply=\"" + utils::preview(result.reply) + "\"");
        return parsed;
    }

private:
    BackendConfig config_;
};

BackendDispatchClient::BackendDispatchClient(const BackendConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

BackendDispatchClient::~BackendDispatchClient() = default;

Result<BackendResult> BackendDispatchClient::dispatch(const std::string& session_id, const std::string& text) {
    return pimpl_->dispatch(session_id, text);
}

} // namespace wayfarer
