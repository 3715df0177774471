#pragma once

#include "autopilot_link.hpp"

#include <atomic>
#include <mavsdk/plugins/telemetry/telemetry.h>
#include <mutex>
#include <optional>
#include <string>

/**
 * @brief 无人机遥测数据监控器，用于实时跟踪无人机状态
 *
 * 订阅位置、姿态、速度、电池、飞行模式和解锁状态，回调线程写入，其他模块通过线程安全接口读取最近一次的遥测样本。
 */
class TelemetryMonitor
{
public:
    explicit TelemetryMonitor(mavsdk::Telemetry &telemetry);
    ~TelemetryMonitor(); // 析构时取消所有订阅

    std::optional<TelemetrySample> latestSample() const; // 尚未收到任何位置数据时返回空

    static std::string flight_mode_str(mavsdk::Telemetry::FlightMode mode); // 将飞行模式枚举转换为字符串

    static FlightMode toFlightMode(mavsdk::Telemetry::FlightMode mode);

private:
    void subscribeAll();
    void touch(); // 更新样本时间戳(调用方持有锁)

    mavsdk::Telemetry &telemetry; // 外部传入的遥测插件引用

    TelemetrySample sample_;                            // 最近一次遥测样本
    mavsdk::Telemetry::FlightMode current_flight_mode_; // 原始飞行模式，用于判断模式变化
    bool received_any_ = false;                         // 是否收到过位置数据

    mutable std::mutex sample_mutex_; // 保护遥测样本的互斥锁

    mavsdk::Telemetry::PositionHandle position_handle_;
    mavsdk::Telemetry::AttitudeEulerHandle attitude_handle_;
    mavsdk::Telemetry::VelocityNedHandle velocity_handle_;
    mavsdk::Telemetry::BatteryHandle battery_handle_;
    mavsdk::Telemetry::FlightModeHandle flight_mode_handle_;
    mavsdk::Telemetry::ArmedHandle armed_handle_;

    std::atomic<bool> running_{true};
};
