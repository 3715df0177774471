#ifndef MAVSDK_MEMBERS_HPP
#define MAVSDK_MEMBERS_HPP

#include <memory>

#include <mavsdk/mavsdk.h>
#include <mavsdk/plugins/action/action.h>
#include <mavsdk/plugins/mission/mission.h>
#include <mavsdk/plugins/telemetry/telemetry.h>

// 飞控系统及其插件集合，在程序中统一传递
class Mavsdk_members
{
public:
    Mavsdk_members(std::shared_ptr<mavsdk::System> sys,
                   mavsdk::Telemetry &t,
                   mavsdk::Mission &m,
                   mavsdk::Action &a);

    std::shared_ptr<mavsdk::System> system;
    mavsdk::Telemetry &telemetry;
    mavsdk::Mission &mission;
    mavsdk::Action &action;
};

#endif
