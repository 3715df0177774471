#ifndef YOLO_DNN_BACKEND_HPP
#define YOLO_DNN_BACKEND_HPP

#include "config.hpp"
#include "inference_backend.hpp"

#include <opencv2/dnn.hpp>

// 等比缩放后的缩放比例与填充偏移
struct Letterbox
{
    float scale = 1.0f;
    int pad_x = 0;
    int pad_y = 0;
};

/**
 * @brief 等比缩放到 size x size，不足部分用灰色(114)居中填充
 * @param out 输出图像
 * @return 用于把模型坐标还原到原图的参数
 */
Letterbox letterbox_image(const cv::Mat &image, int size, cv::Mat &out);

// 模型输入坐标系下的中心点框还原到原图，并裁剪到图像范围内
cv::Rect unletterbox_box(float cx, float cy, float w, float h, const Letterbox &letterbox, const cv::Size &image_size);

/**
 * @brief 基于 OpenCV DNN 的 YOLOv11 推理后端
 * 支持两种输出布局：
 *   [1, 5|6, N]    cx, cy, w, h, conf, (class_id)
 *   [1, 4+nc, N]   cx, cy, w, h, 每类得分
 */
class YoloDnnBackend : public InferenceBackend
{
public:
    YoloDnnBackend(const StageConfig &config, DetectionClass target_class);

    bool load() override;
    InferenceResult infer(const cv::Mat &image) override;
    std::string name() const override;

private:
    std::vector<Detection> decode(const cv::Mat &output, const cv::Size &image_size, const Letterbox &letterbox) const;

    StageConfig config_;
    DetectionClass target_class_;
    cv::dnn::Net net_;
    bool ready_ = false;
    bool using_cuda_ = false;
};

#endif // YOLO_DNN_BACKEND_HPP
