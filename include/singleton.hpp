#ifndef SINGLETON_HPP
#define SINGLETON_HPP

/**
 * @brief 通用单例模板
 * 使用函数内静态对象，首次调用 Instance() 时构造，线程安全(C++11)
 */
template <typename T>
class NormalSingleton
{
public:
    static T *Instance()
    {
        static T instance;
        return &instance;
    }

    NormalSingleton(const NormalSingleton &) = delete;
    NormalSingleton &operator=(const NormalSingleton &) = delete;

private:
    NormalSingleton() = default;
    ~NormalSingleton() = default;
};

#endif // SINGLETON_HPP
