#include "yolo_dnn_backend.hpp"
#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

#include <opencv2/core/cuda.hpp>
#include <opencv2/imgproc.hpp>

Letterbox letterbox_image(const cv::Mat &image, int size, cv::Mat &out)
{
    Letterbox lb;
    lb.scale = std::min(static_cast<float>(size) / static_cast<float>(image.cols),
                        static_cast<float>(size) / static_cast<float>(image.rows));

    const int new_w = std::max(1, static_cast<int>(std::round(image.cols * lb.scale)));
    const int new_h = std::max(1, static_cast<int>(std::round(image.rows * lb.scale)));
    lb.pad_x = (size - new_w) / 2;
    lb.pad_y = (size - new_h) / 2;

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(new_w, new_h), 0, 0, cv::INTER_LINEAR);
    cv::copyMakeBorder(resized, out, lb.pad_y, size - new_h - lb.pad_y, lb.pad_x, size - new_w - lb.pad_x,
                       cv::BORDER_CONSTANT, cv::Scalar(114, 114, 114));
    return lb;
}

cv::Rect unletterbox_box(float cx, float cy, float w, float h, const Letterbox &letterbox, const cv::Size &image_size)
{
    const float x1 = (cx - 0.5f * w - static_cast<float>(letterbox.pad_x)) / letterbox.scale;
    const float y1 = (cy - 0.5f * h - static_cast<float>(letterbox.pad_y)) / letterbox.scale;
    cv::Rect box(static_cast<int>(std::round(x1)), static_cast<int>(std::round(y1)),
                 static_cast<int>(std::round(w / letterbox.scale)), static_cast<int>(std::round(h / letterbox.scale)));
    return box & cv::Rect(0, 0, image_size.width, image_size.height);
}

YoloDnnBackend::YoloDnnBackend(const StageConfig &config, DetectionClass target_class)
    : config_(config), target_class_(target_class)
{
}

std::string YoloDnnBackend::name() const
{
    return detectionClassToString(target_class_) + "@" + config_.model_path;
}

bool YoloDnnBackend::load()
{
    auto logger = logging::get_logger();
    try
    {
        net_ = cv::dnn::readNet(config_.model_path);
        if (net_.empty())
        {
            logger->error("模型加载失败(空网络): {}", config_.model_path);
            return false;
        }

        using_cuda_ = false;
        if (config_.prefer_cuda && cv::cuda::getCudaEnabledDeviceCount() > 0)
        {
            net_.setPreferableBackend(cv::dnn::DNN_BACKEND_CUDA);
            net_.setPreferableTarget(cv::dnn::DNN_TARGET_CUDA_FP16);
            using_cuda_ = true;
        }
        else
        {
            net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
            net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
        }

        ready_ = true;
        logger->info("模型已加载: {} (input={}, target={})", config_.model_path, config_.input_size, using_cuda_ ? "CUDA" : "CPU");
        return true;
    }
    catch (const cv::Exception &e)
    {
        logger->error("模型加载失败: {} ({})", config_.model_path, e.what());
        ready_ = false;
        return false;
    }
}

InferenceResult YoloDnnBackend::infer(const cv::Mat &image)
{
    InferenceResult result;
    if (!ready_)
    {
        result.status = InferenceStatus::HARDWARE_FAULT;
        return result;
    }
    if (image.empty())
    {
        return result;
    }

    auto start = std::chrono::steady_clock::now();
    try
    {
        cv::Mat input;
        const Letterbox lb = letterbox_image(image, config_.input_size, input);
        cv::Mat blob = cv::dnn::blobFromImage(input, 1.0 / 255.0, cv::Size(), cv::Scalar(), true, false);
        net_.setInput(blob);
        cv::Mat output = net_.forward();
        result.detections = decode(output, image.size(), lb);
    }
    catch (const cv::Exception &e)
    {
        // 前向推理异常视为加速器故障
        logging::get_logger()->error("推理异常 [{}]: {}", name(), e.what());
        result.status = InferenceStatus::HARDWARE_FAULT;
        result.detections.clear();
    }

    result.latency_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    return result;
}

std::vector<Detection> YoloDnnBackend::decode(const cv::Mat &output, const cv::Size &image_size, const Letterbox &letterbox) const
{
    std::vector<Detection> detections;

    int cdim = 0;
    int count = 0;
    if (output.dims == 3)
    {
        cdim = output.size[1];
        count = output.size[2];
    }
    else if (output.dims == 2)
    {
        cdim = output.size[0];
        count = output.size[1];
    }
    if (cdim < 5 || count <= 0)
    {
        return detections;
    }

    const float *data = reinterpret_cast<const float *>(output.data);
    auto at = [&](int row, int i) -> float
    {
        return data[row * count + i];
    };

    const bool packed = cdim <= 6; // 导出时已合并置信度和类别

    std::vector<cv::Rect> boxes;
    std::vector<float> scores;
    for (int i = 0; i < count; ++i)
    {
        float score = 0.0f;
        int cls_id = 0;
        if (packed)
        {
            score = at(4, i);
            cls_id = cdim == 6 ? static_cast<int>(at(5, i)) : 0;
        }
        else
        {
            for (int c = 0; c < cdim - 4; ++c)
            {
                float s = at(4 + c, i);
                if (s > score)
                {
                    score = s;
                    cls_id = c;
                }
            }
        }

        if (score < config_.conf_threshold)
        {
            continue;
        }
        if (config_.class_id >= 0 && cls_id != config_.class_id)
        {
            continue;
        }

        cv::Rect box = unletterbox_box(at(0, i), at(1, i), at(2, i), at(3, i), letterbox, image_size);
        if (box.area() <= 0)
        {
            continue;
        }
        boxes.push_back(box);
        scores.push_back(score);
    }

    std::vector<int> keep;
    cv::dnn::NMSBoxes(boxes, scores, config_.conf_threshold, config_.nms_iou, keep);

    detections.reserve(keep.size());
    for (int idx : keep)
    {
        Detection det;
        det.cls = target_class_;
        det.confidence = scores[idx];
        det.box = boxes[idx];
        det.stage = target_class_ == DetectionClass::SMOKE ? StageId::STAGE1_SMOKE : StageId::STAGE2_FIRE;
        detections.push_back(det);
    }
    return detections;
}
