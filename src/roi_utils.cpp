#include "roi_utils.hpp"

#include <algorithm>

std::optional<cv::Rect> union_boxes(const std::vector<Detection> &detections)
{
    if (detections.empty())
    {
        return std::nullopt;
    }

    cv::Rect result = detections.front().box;
    for (const auto &det : detections)
    {
        result |= det.box; // cv::Rect 的并集运算即外接矩形
    }
    return result;
}

cv::Rect expand_box(const cv::Rect &box, double margin, const cv::Size &image_size)
{
    const cv::Rect full(0, 0, image_size.width, image_size.height);

    const double bw = box.width;
    const double bh = box.height;

    double x1 = box.x - bw * margin;
    double y1 = box.y - bh * margin;
    double x2 = box.x + bw + bw * margin;
    double y2 = box.y + bh + bh * margin;

    x1 = std::clamp(x1, 0.0, static_cast<double>(image_size.width));
    y1 = std::clamp(y1, 0.0, static_cast<double>(image_size.height));
    x2 = std::clamp(x2, 0.0, static_cast<double>(image_size.width));
    y2 = std::clamp(y2, 0.0, static_cast<double>(image_size.height));

    if (x2 <= x1 + 2 || y2 <= y1 + 2)
    {
        return full;
    }

    cv::Rect expanded(static_cast<int>(x1), static_cast<int>(y1),
                      static_cast<int>(x2 - x1), static_cast<int>(y2 - y1));
    return expanded & full;
}

cv::Rect compute_roi(const std::vector<Detection> &detections, double margin, const cv::Size &image_size)
{
    auto united = union_boxes(detections);
    if (!united)
    {
        return cv::Rect(0, 0, image_size.width, image_size.height);
    }
    return expand_box(*united, margin, image_size);
}

double box_area_ratio(const cv::Rect &box, const cv::Size &image_size)
{
    const double frame_area = static_cast<double>(image_size.width) * image_size.height;
    if (frame_area <= 0.0)
    {
        return 0.0;
    }
    return static_cast<double>(box.area()) / frame_area;
}
