#ifndef MQTT_CLIENT_HPP
#define MQTT_CLIENT_HPP

#include "config.hpp"
#include "mqtt/async_client.h" // MQTT客户端库
#include "singleton.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief MQTT客户端类
 * 提供MQTT通信功能，支持主题订阅、消息发布和断线重连
 * 所有主题都带配置中的前缀，例如 firewatch/cmd
 */
class Mqtt : public virtual mqtt::callback // 继承mqtt::callback基类
{
private:
    std::unique_ptr<mqtt::async_client> client; // MQTT客户端对象
    MqttConfig config;
    std::mutex sendMutex;             // 发送锁
    std::mutex callbackMutex;         // 回调锁
    std::atomic<bool> running{false}; // 运行标志

private:
    // 回调函数映射表(完整主题 -> 回调)
    using MessageCallback = std::function<void(const std::vector<unsigned char> &payload)>;
    std::map<std::string, MessageCallback> topicCallbacks;

    // 从mqtt::callback继承的接口实现
    void connection_lost(const std::string &cause) override;
    void message_arrived(mqtt::const_message_ptr msg) override;

    void resubscribe(); // 重连后恢复订阅

public:
    Mqtt() = default;
    ~Mqtt();

    bool init(const MqttConfig &cfg); // 初始化MQTT连接
    void shutdown();
    bool isConnected() const;

    std::string topic(const std::string &suffix) const; // 拼接带前缀的主题

    void subscribeTopic(const std::string &topic, MessageCallback callback); // 订阅主题并设置回调函数
    void unsubscribeTopic(const std::string &topic);                         // 取消订阅主题

    bool sendMessage(const std::string &topic, const std::string &payload); // 发送MQTT消息(QoS 0，最多等待 publish_timeout_ms)

    /**
     * @brief 发送消息并等待投递确认
     * @param qos 服务质量等级
     * @param timeout 等待确认的最长时间，超时返回 false
     */
    bool sendMessage(const std::string &topic, const void *data, std::size_t size, int qos, std::chrono::milliseconds timeout);
};

typedef NormalSingleton<Mqtt> mqtt_client;

#endif // MQTT_CLIENT_HPP
