#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace wayfarer {

/**
 * @brief Which panel the visual display shows
 */
enum class ViewMode {
    Itinerary,
    Flights,
    Hotels,
    HotelBooking,
    FlightBooking,
    Loading,
    Search
};

inline const char* view_mode_name(ViewMode mode) {
    switch (mode) {
        case ViewMode::Itinerary: return "itinerary";
        case ViewMode::Flights: return "flights";
        case ViewMode::Hotels: return "hotels";
        case ViewMode::HotelBooking: return "hotel-booking";
        case ViewMode::FlightBooking: return "flight-booking";
        case ViewMode::Loading: return "loading";
        case ViewMode::Search: return "search";
    }
    return "search";
}

/**
 * @brief Receiver of visual panel commands issued by the session
 */
class IVisualStateSink {
public:
    virtual ~IVisualStateSink() = default;

    virtual void set_visual_data(const nlohmann::json& payload) = 0;
    virtual void set_view_mode(ViewMode mode) = 0;

    /// "Thinking" indicator shown while a backend reply is pending
    virtual void set_thinking(bool thinking) = 0;
};

} // namespace wayfarer
