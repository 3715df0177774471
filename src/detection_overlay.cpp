#include "detection_overlay.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cstdio>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

const cv::Scalar COLOR_SMOKE(180, 180, 180);
const cv::Scalar COLOR_FIRE(0, 0, 255);
const cv::Scalar COLOR_BANNER(80, 80, 80);

namespace
{
    const cv::Scalar COLOR_TEXT(255, 255, 255);

    std::string percent_label(const char *prefix, float conf)
    {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%s %.1f%%", prefix, conf * 100.0f);
        return buf;
    }

    void draw_banner(cv::Mat &image, int top, int height, const cv::Scalar &color, const std::string &text)
    {
        cv::rectangle(image, cv::Rect(0, top, image.cols, height), color, cv::FILLED);
        cv::putText(image, text, cv::Point(10, top + height - 12), cv::FONT_HERSHEY_SIMPLEX, 0.8, COLOR_TEXT, 2, cv::LINE_AA);
    }
}

void draw_detections(cv::Mat &image, const std::vector<Detection> &detections)
{
    for (const auto &det : detections)
    {
        const bool fire = det.cls == DetectionClass::FIRE;
        const cv::Scalar &color = fire ? COLOR_FIRE : COLOR_SMOKE;
        cv::rectangle(image, det.box, color, 2);
        cv::putText(image, percent_label(fire ? "fire" : "smoke", det.confidence),
                    cv::Point(det.box.x, std::max(0, det.box.y - 6)),
                    cv::FONT_HERSHEY_SIMPLEX, 0.6, color, 2, cv::LINE_AA);
    }
}

void draw_status_overlay(cv::Mat &image, const AggregateState &state, TimePoint now, double fire_hold_sec, double fps)
{
    char buf[128];

    if (state.has_smoke)
    {
        std::snprintf(buf, sizeof(buf), "SMOKE WARNING conf=%.1f%% consec=%d", state.smoke_max_conf * 100.0f, state.smoke_consecutive_frames);
        draw_banner(image, 0, 40, COLOR_BANNER, buf);
    }

    if (state.has_fire)
    {
        double remaining = fire_hold_sec;
        if (state.last_fire_confirm_time)
        {
            remaining = std::max(0.0, fire_hold_sec - seconds_between(*state.last_fire_confirm_time, now));
        }
        std::snprintf(buf, sizeof(buf), "FIRE CONFIRMED hold=%.1fs", remaining);
        draw_banner(image, 40, 40, COLOR_FIRE, buf);
    }

    // 第一阶段故障必须在画面上醒目提示
    if (state.stage1_fault)
    {
        draw_banner(image, std::max(0, image.rows / 2 - 20), 40, COLOR_FIRE, "SMOKE DETECTOR FAULT");
    }
    else if (state.smoke_only_mode)
    {
        cv::putText(image, "SMOKE-ONLY MODE", cv::Point(10, image.rows - 40), cv::FONT_HERSHEY_SIMPLEX, 0.6, COLOR_FIRE, 2, cv::LINE_AA);
    }

    std::snprintf(buf, sizeof(buf), "FPS: %.1f", fps);
    cv::putText(image, buf, cv::Point(10, image.rows - 10), cv::FONT_HERSHEY_SIMPLEX, 0.6, COLOR_TEXT, 2, cv::LINE_AA);
}

cv::Mat render_alert_image(const cv::Mat &frame, const std::vector<Detection> &detections, const std::string &banner, const cv::Scalar &banner_color)
{
    cv::Mat image = frame.clone();
    if (image.empty())
    {
        return image;
    }
    draw_detections(image, detections);
    draw_banner(image, 0, 48, banner_color, banner);
    return image;
}

std::vector<unsigned char> encode_jpeg(const cv::Mat &image, int quality)
{
    std::vector<unsigned char> buffer;
    if (image.empty())
    {
        return buffer;
    }

    try
    {
        std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 10, 100)};
        if (!cv::imencode(".jpg", image, buffer, params))
        {
            buffer.clear();
        }
    }
    catch (const cv::Exception &e)
    {
        logging::get_logger()->error("JPEG 编码失败: {}", e.what());
        buffer.clear();
    }
    return buffer;
}
