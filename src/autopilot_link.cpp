#include "autopilot_link.hpp"

std::string flightModeToString(FlightMode mode)
{
    switch (mode)
    {
        case FlightMode::MISSION:
            return "Mission";
        case FlightMode::HOLD:
            return "Hold";
        case FlightMode::RETURN_TO_LAUNCH:
            return "ReturnToLaunch";
        case FlightMode::TAKEOFF:
            return "Takeoff";
        case FlightMode::LAND:
            return "Land";
        case FlightMode::MANUAL:
            return "Manual";
        case FlightMode::OTHER:
            return "Other";
        default:
            return "Unknown";
    }
}

std::string commandResultToString(CommandResult result)
{
    switch (result)
    {
        case CommandResult::ACK:
            return "ACK";
        case CommandResult::REJECTED:
            return "REJECTED";
        case CommandResult::TIMEOUT:
            return "TIMEOUT";
        case CommandResult::LINK_LOST:
            return "LINK_LOST";
        case CommandResult::CANCELLED:
            return "CANCELLED";
        default:
            return "UNKNOWN";
    }
}
