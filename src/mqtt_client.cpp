#include "mqtt_client.hpp"
#include "logger.hpp"

#include <thread>

/**
 * @brief MQTT客户端析构函数
 */
Mqtt::~Mqtt()
{
    shutdown();
}

/**
 * @brief 初始化MQTT连接
 */
bool Mqtt::init(const MqttConfig &cfg)
{
    auto logger = logging::get_logger();
    config = cfg;

    const std::string server_uri = "tcp://" + config.broker + ":" + std::to_string(config.port);
    try
    {
        client = std::make_unique<mqtt::async_client>(server_uri, config.client_id);
        client->set_callback(*this); // 设置回调
    }
    catch (const mqtt::exception &e)
    {
        logger->error("[mqtt] 创建客户端失败({}): {}", server_uri, e.what());
        return false;
    }

    mqtt::connect_options connOpts;
    connOpts.set_keep_alive_interval(config.keep_alive);
    if (!config.username.empty())
    {
        connOpts.set_user_name(config.username);
        connOpts.set_password(config.password);
    }
    connOpts.set_clean_session(true);

    try
    {
        client->connect(connOpts)->wait();
        running = true;
        logger->info("[mqtt] 已连接 {} (client id {})", server_uri, config.client_id);
        sendMessage(topic("reply"), "firewatch MQTT客户端已连接");
        return true;
    }
    catch (const mqtt::exception &e)
    {
        logger->error("[mqtt] 连接失败({}): {}", server_uri, e.what());
        return false;
    }
}

void Mqtt::shutdown()
{
    running = false;
    if (!client || !client->is_connected())
    {
        return;
    }

    try
    {
        client->disconnect()->wait();
    }
    catch (const mqtt::exception &e)
    {
        logging::get_logger()->error("[mqtt] 断开连接失败: {}", e.what());
    }
}

bool Mqtt::isConnected() const
{
    return client && client->is_connected();
}

std::string Mqtt::topic(const std::string &suffix) const
{
    if (config.topic_prefix.empty())
    {
        return suffix;
    }
    return config.topic_prefix + "/" + suffix;
}

/*:::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::*/

/**
 * @brief 订阅主题并设置回调函数
 */
void Mqtt::subscribeTopic(const std::string &topic, MessageCallback callback)
{
    {
        std::lock_guard<std::mutex> lock(callbackMutex);
        topicCallbacks[topic] = callback;
    }

    if (!isConnected())
    {
        return; // 连接后由 resubscribe 补订
    }

    try
    {
        client->subscribe(topic, 1)->wait();
        logging::get_logger()->info("[mqtt] 已订阅 {}", topic);
    }
    catch (const mqtt::exception &e)
    {
        logging::get_logger()->error("[mqtt] 订阅主题 {} 失败: {}", topic, e.what());
    }
}

/**
 * @brief 取消订阅主题
 */
void Mqtt::unsubscribeTopic(const std::string &topic)
{
    {
        std::lock_guard<std::mutex> lock(callbackMutex);
        topicCallbacks.erase(topic);
    }

    if (!isConnected())
    {
        return;
    }

    try
    {
        client->unsubscribe(topic)->wait();
    }
    catch (const mqtt::exception &e)
    {
        logging::get_logger()->error("[mqtt] 取消订阅主题 {} 失败: {}", topic, e.what());
    }
}

void Mqtt::resubscribe()
{
    std::vector<std::string> topics;
    {
        std::lock_guard<std::mutex> lock(callbackMutex);
        for (const auto &item : topicCallbacks)
        {
            topics.push_back(item.first);
        }
    }

    for (const auto &t : topics)
    {
        try
        {
            client->subscribe(t, 1)->wait();
        }
        catch (const mqtt::exception &e)
        {
            logging::get_logger()->error("[mqtt] 重新订阅 {} 失败: {}", t, e.what());
        }
    }
}

/*:::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::*/

/**
 * @brief 发送MQTT消息
 * 发送锁只保护 publish 调用，等待投递确认时不持有锁
 */
bool Mqtt::sendMessage(const std::string &topic, const std::string &payload)
{
    return sendMessage(topic, payload.data(), payload.size(), 0, std::chrono::milliseconds(config.publish_timeout_ms));
}

bool Mqtt::sendMessage(const std::string &topic, const void *data, std::size_t size, int qos, std::chrono::milliseconds timeout)
{
    mqtt::delivery_token_ptr token;
    try
    {
        std::lock_guard<std::mutex> lock(sendMutex);
        if (!isConnected())
        {
            logging::get_logger()->debug("[mqtt] 未连接到代理，无法发送 {}", topic);
            return false;
        }
        token = client->publish(mqtt::make_message(topic, data, size, qos, false));
    }
    catch (const std::exception &e)
    {
        logging::get_logger()->error("[mqtt] 发送消息失败: {}", e.what());
        return false;
    }

    try
    {
        if (!token->wait_for(timeout))
        {
            logging::get_logger()->warn("[mqtt] {} 投递确认超时({}ms)", topic, timeout.count());
            return false;
        }
        return true;
    }
    catch (const std::exception &e)
    {
        logging::get_logger()->error("[mqtt] {} 投递失败: {}", topic, e.what());
        return false;
    }
}

/**
 * @brief 连接丢失处理
 */
void Mqtt::connection_lost(const std::string &cause)
{
    auto logger = logging::get_logger();
    logger->warn("[mqtt] 连接丢失: {}，尝试重新连接...", cause);

    while (running && !client->is_connected())
    {
        try
        {
            client->reconnect()->wait();
            logger->info("[mqtt] 重新连接成功");
            resubscribe();
            sendMessage(topic("reply"), "连接已恢复");
        }
        catch (const mqtt::exception &e)
        {
            logger->error("[mqtt] 重连失败: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(5));
        }
    }
}

/*:::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::*/

/**
 * @brief 消息到达处理
 */
void Mqtt::message_arrived(mqtt::const_message_ptr msg)
{
    std::string topic = msg->get_topic();
    const auto &raw = msg->get_payload();
    std::vector<unsigned char> payload(raw.begin(), raw.end());

    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex);
        auto it = topicCallbacks.find(topic);
        if (it != topicCallbacks.end())
        {
            callback = it->second;
        }
    }

    if (callback)
    {
        callback(payload);
    }
    else
    {
        logging::get_logger()->debug("[mqtt] 收到未处理消息 [主题: {}] {} 字节", topic, payload.size());
    }
}
