#pragma once

#include "config.h"
#include "errors.h"
#include "visual_state.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

namespace wayfarer {

/**
 * @brief Structured reply of one backend exchange
 *
 * At most one of flights/hotels/booking carries data; the others are null.
 */
struct BackendResult {
    std::string reply;
    std::string intent;
    nlohmann::json slots = nlohmann::json::object();
    nlohmann::json flights;   ///< Array of flight offers, or null
    nlohmann::json hotels;    ///< Array of hotels, or null
    nlohmann::json booking;   ///< Booking record object, or null

    bool has_flights() const { return flights.is_array() && !flights.empty(); }
    bool has_hotels() const { return hotels.is_array() && !hotels.empty(); }
    bool has_booking() const { return booking.is_object() && !booking.empty(); }
};

/**
 * @brief Panel command derived from a backend result
 */
struct VisualUpdate {
    ViewMode mode = ViewMode::Itinerary;
    nlohmann::json payload;
};

/**
 * @brief Map a result to a visual update (flights, then hotels, then booking)
 * @return nullopt when the reply carries no visual data
 */
std::optional<VisualUpdate> visual_update_for(const BackendResult& result);

/**
 * @brief Parse a backend response body; missing or null optional fields are allowed
 */
Result<BackendResult> parse_backend_response(const std::string& body);

/**
 * @brief One request/response exchange with the travel backend
 */
class IBackendClient {
public:
    virtual ~IBackendClient() = default;

    /**
     * @return BackendUnavailable error on transport failure, non-2xx status or bad body
     */
    virtual Result<BackendResult> dispatch(const std::string& session_id, const std::string& text) = 0;
};

/**
 * @brief HTTP backend client (libcurl)
 */
class BackendDispatchClient : public IBackendClient {
public:
    explicit BackendDispatchClient(const BackendConfig& config);
    ~BackendDispatchClient() override;

    // Non-copyable
    BackendDispatchClient(const BackendDispatchClient&) = delete;
    BackendDispatchClient& operator=(const BackendDispatchClient&) = delete;

    Result<BackendResult> dispatch(const std::string& session_id, const std::string& text) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace wayfarer
