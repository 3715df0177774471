#pragma once

#include "detection_types.hpp"

#include <string>

#include <opencv2/core.hpp>

/**
 * @brief 推理后端接口
 * 每个阶段持有独立的后端实例，后端只在所属会话的工作线程中调用
 */
class InferenceBackend
{
public:
    virtual ~InferenceBackend() = default;

    // 加载模型，失败返回 false
    virtual bool load() = 0;

    // 对输入图像推理，返回框为输入图像坐标
    virtual InferenceResult infer(const cv::Mat &image) = 0;

    virtual std::string name() const = 0;
};
