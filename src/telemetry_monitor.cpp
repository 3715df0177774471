#include "telemetry_monitor.hpp"
#include "logger.hpp"

#include <cmath>

using namespace mavsdk;

TelemetryMonitor::TelemetryMonitor(Telemetry &telemetry) : telemetry(telemetry)
{
    current_flight_mode_ = Telemetry::FlightMode::Unknown; // 初始化飞行模式为未知
    sample_ = TelemetrySample{};                           // 初始化遥测样本为默认值

    // 位置 10Hz，其余使用飞控默认频率
    const Telemetry::Result rate_result = telemetry.set_rate_position(10.0);
    if (rate_result != Telemetry::Result::Success)
    {
        logging::get_logger()->warn("设置位置数据频率失败: {}", static_cast<int>(rate_result));
    }

    subscribeAll();
}

TelemetryMonitor::~TelemetryMonitor()
{
    if (running_.exchange(false))
    {
        telemetry.unsubscribe_position(position_handle_);
        telemetry.unsubscribe_attitude_euler(attitude_handle_);
        telemetry.unsubscribe_velocity_ned(velocity_handle_);
        telemetry.unsubscribe_battery(battery_handle_);
        telemetry.unsubscribe_flight_mode(flight_mode_handle_);
        telemetry.unsubscribe_armed(armed_handle_);
    }
}

void TelemetryMonitor::touch()
{
    sample_.timestamp = Clock::now();
}

void TelemetryMonitor::subscribeAll()
{
    // 订阅位置数据(经纬度、高度)
    position_handle_ = telemetry.subscribe_position(
        [this](Telemetry::Position position)
        {
            std::lock_guard<std::mutex> lock(sample_mutex_);
            if (std::isnan(position.latitude_deg) || std::isnan(position.longitude_deg))
            {
                return; // 未定位
            }
            sample_.has_position = true;
            sample_.latitude_deg = position.latitude_deg;
            sample_.longitude_deg = position.longitude_deg;
            sample_.absolute_altitude_m = position.absolute_altitude_m;
            sample_.relative_altitude_m = position.relative_altitude_m;
            received_any_ = true;
            touch();
        });

    // 订阅欧拉角数据
    attitude_handle_ = telemetry.subscribe_attitude_euler(
        [this](Telemetry::EulerAngle attitude_euler)
        {
            std::lock_guard<std::mutex> lock(sample_mutex_);
            sample_.roll_deg = attitude_euler.roll_deg;
            sample_.pitch_deg = attitude_euler.pitch_deg;
            sample_.yaw_deg = attitude_euler.yaw_deg;
        });

    // 订阅速度数据，计算地速
    velocity_handle_ = telemetry.subscribe_velocity_ned(
        [this](Telemetry::VelocityNed velocity)
        {
            std::lock_guard<std::mutex> lock(sample_mutex_);
            sample_.ground_speed_m_s = std::hypot(velocity.north_m_s, velocity.east_m_s);
        });

    // 订阅电池数据
    battery_handle_ = telemetry.subscribe_battery(
        [this](Telemetry::Battery battery)
        {
            std::lock_guard<std::mutex> lock(sample_mutex_);
            sample_.battery_remaining_percent = battery.remaining_percent;
        });

    // 订阅飞行模式数据
    flight_mode_handle_ = telemetry.subscribe_flight_mode(
        [this](Telemetry::FlightMode flight_mode)
        {
            std::lock_guard<std::mutex> lock(sample_mutex_);
            if (flight_mode != current_flight_mode_)
            {
                logging::get_logger()->info("飞行模式切换: {} -> {}", flight_mode_str(current_flight_mode_), flight_mode_str(flight_mode));
            }
            current_flight_mode_ = flight_mode;
            sample_.flight_mode = toFlightMode(flight_mode);
            sample_.flight_mode_name = flight_mode_str(flight_mode);
        });

    // 订阅解锁状态
    armed_handle_ = telemetry.subscribe_armed(
        [this](bool armed)
        {
            std::lock_guard<std::mutex> lock(sample_mutex_);
            sample_.armed = armed;
        });
}

std::optional<TelemetrySample> TelemetryMonitor::latestSample() const
{
    std::lock_guard<std::mutex> lock(sample_mutex_);
    if (!received_any_)
    {
        return std::nullopt;
    }
    return sample_;
}

FlightMode TelemetryMonitor::toFlightMode(Telemetry::FlightMode mode)
{
    switch (mode)
    {
        case Telemetry::FlightMode::Mission:
            return FlightMode::MISSION;
        case Telemetry::FlightMode::Hold:
            return FlightMode::HOLD;
        case Telemetry::FlightMode::ReturnToLaunch:
            return FlightMode::RETURN_TO_LAUNCH;
        case Telemetry::FlightMode::Takeoff:
            return FlightMode::TAKEOFF;
        case Telemetry::FlightMode::Land:
            return FlightMode::LAND;
        case Telemetry::FlightMode::Manual:
        case Telemetry::FlightMode::Posctl:
        case Telemetry::FlightMode::Altctl:
        case Telemetry::FlightMode::Stabilized:
        case Telemetry::FlightMode::Acro:
            return FlightMode::MANUAL;
        case Telemetry::FlightMode::Unknown:
            return FlightMode::UNKNOWN;
        default:
            return FlightMode::OTHER;
    }
}

// 辅助函数：将飞行模式枚举转换为字符串
std::string TelemetryMonitor::flight_mode_str(Telemetry::FlightMode mode)
{
    switch (mode)
    {
        case Telemetry::FlightMode::Unknown:
            return "Unknown";
        case Telemetry::FlightMode::Ready:
            return "Ready";
        case Telemetry::FlightMode::Takeoff:
            return "Takeoff";
        case Telemetry::FlightMode::Hold:
            return "Hold";
        case Telemetry::FlightMode::Mission:
            return "Mission";
        case Telemetry::FlightMode::ReturnToLaunch:
            return "ReturnToLaunch";
        case Telemetry::FlightMode::Land:
            return "Land";
        case Telemetry::FlightMode::Offboard:
            return "Offboard";
        case Telemetry::FlightMode::FollowMe:
            return "FollowMe";
        case Telemetry::FlightMode::Posctl:
            return "Position";
        case Telemetry::FlightMode::Altctl:
            return "Altitude";
        case Telemetry::FlightMode::Stabilized:
            return "Stabilized";
        case Telemetry::FlightMode::Acro:
            return "Acro";
        default:
            return "Invalid";
    }
}
