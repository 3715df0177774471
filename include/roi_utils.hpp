#ifndef ROI_UTILS_HPP
#define ROI_UTILS_HPP

#include "detection_types.hpp"

#include <optional>
#include <vector>

#include <opencv2/core.hpp>

// 所有检测框的外接矩形，输入为空时返回空
std::optional<cv::Rect> union_boxes(const std::vector<Detection> &detections);

/**
 * @brief 按比例外扩矩形并裁剪到图像范围内
 * @param box 原始矩形
 * @param margin 外扩比例(相对框宽高)
 * @param image_size 图像尺寸
 * @return 外扩后的矩形；结果退化(宽或高不超过 2 像素)时返回整幅图像
 */
cv::Rect expand_box(const cv::Rect &box, double margin, const cv::Size &image_size);

// 根据合格烟雾框计算第二阶段 ROI，无框时返回整幅图像
cv::Rect compute_roi(const std::vector<Detection> &detections, double margin, const cv::Size &image_size);

// 检测框面积占整幅图像的比例
double box_area_ratio(const cv::Rect &box, const cv::Size &image_size);

#endif // ROI_UTILS_HPP
