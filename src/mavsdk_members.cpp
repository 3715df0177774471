#include "mavsdk_members.hpp"

using namespace mavsdk;

// Mavsdk_members类的构造函数（初始化对象）
// 功能：将飞控系统和各MAVSDK插件实例绑定到Mavsdk_members
Mavsdk_members::Mavsdk_members(std::shared_ptr<System> sys,
                               Telemetry &t,
                               Mission &m,
                               Action &a)
    : system(std::move(sys)),
      telemetry(t),
      mission(m),
      action(a)
{
}
