#ifndef DETECTION_OVERLAY_HPP
#define DETECTION_OVERLAY_HPP

#include "detection_aggregator.hpp"
#include "detection_types.hpp"

#include <string>
#include <vector>

#include <opencv2/core.hpp>

// 绘制检测框和置信度标签(烟雾灰色，明火红色)
void draw_detections(cv::Mat &image, const std::vector<Detection> &detections);

// 绘制实时视频流上的状态横幅和帧率
void draw_status_overlay(cv::Mat &image, const AggregateState &state, TimePoint now, double fire_hold_sec, double fps);

// 告警图片：原图 + 检测框 + 顶部横幅
cv::Mat render_alert_image(const cv::Mat &frame, const std::vector<Detection> &detections, const std::string &banner, const cv::Scalar &banner_color);

// JPEG 编码，失败返回空
std::vector<unsigned char> encode_jpeg(const cv::Mat &image, int quality);

extern const cv::Scalar COLOR_SMOKE;
extern const cv::Scalar COLOR_FIRE;
extern const cv::Scalar COLOR_BANNER;

#endif // DETECTION_OVERLAY_HPP
