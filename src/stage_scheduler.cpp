#include "stage_scheduler.hpp"
#include "detection_overlay.hpp"
#include "logger.hpp"
#include "roi_utils.hpp"

AggregatorConfig make_aggregator_config(const DetectionConfig &config)
{
    AggregatorConfig agg;
    agg.smoke_threshold = config.stage1.conf_threshold;
    agg.fire_threshold = config.stage2.conf_threshold;
    agg.smoke_consecutive_frames = config.smoke_consecutive_frames;
    agg.fire_confirm_frames = config.fire_confirm_frames;
    agg.fire_hold_sec = config.fire_hold_sec;
    return agg;
}

StageScheduler::StageScheduler(const DetectionConfig &config, InferenceSession &stage1, InferenceSession &stage2, DetectionAggregator &aggregator)
    : config_(config), stage1_(stage1), stage2_(stage2), aggregator_(aggregator)
{
}

void StageScheduler::setEventSink(DetectionEventSink sink)
{
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
}

void StageScheduler::setFireHitSink(FireHitSink sink)
{
    std::lock_guard<std::mutex> lock(sink_mutex_);
    fire_hit_sink_ = std::move(sink);
}

TickResult StageScheduler::processFrame(const Frame &frame, bool annotate)
{
    auto logger = logging::get_logger();
    TickResult tick;
    tick.seq = frame.seq;

    // 1. 第一阶段：每帧必跑
    InferenceResult r1 = stage1_.infer(frame.image);
    tick.stage1_status = r1.status;

    switch (r1.status)
    {
        case InferenceStatus::TIMEOUT:
            aggregator_.markStageTimeout(StageId::STAGE1_SMOKE);
            logger->warn("[stage1] 帧 {} {}，按无检测处理", frame.seq, errorKindToString(ErrorKind::INFERENCE_TIMEOUT));
            break;
        case InferenceStatus::HARDWARE_FAULT:
            aggregator_.markStageFault(StageId::STAGE1_SMOKE);
            if (!stage1_fault_reported_)
            {
                stage1_fault_reported_ = true;
                logger->critical("[stage1] {}：烟雾检测不可用，视频流继续运行", errorKindToString(ErrorKind::INFERENCE_HARDWARE_FAULT));
            }
            break;
        default:
            break;
    }

    tick.smoke_detections = filterSmoke(r1, frame);

    // 2. 聚合(迟滞在聚合器内完成)
    AggregateUpdate update = aggregator_.update(StageId::STAGE1_SMOKE, tick.smoke_detections, frame.seq, frame.timestamp);
    if (update.smoke_rising)
    {
        logger->warn("烟雾预警: conf={:.2f}, boxes={}, consec={}", update.state.smoke_max_conf, update.state.smoke_box_count, update.state.smoke_consecutive_frames);
        emit(DetectionClass::SMOKE, update.state, frame, tick.smoke_detections);
    }
    else if (update.smoke_falling)
    {
        logger->info("烟雾消失 (frame={})", frame.seq);
    }
    if (update.fire_falling)
    {
        logger->info("明火保持时间结束");
    }

    // 3. 第二阶段：仅在本帧有合格烟雾时尝试
    if (!tick.smoke_detections.empty())
    {
        tick.stage2_submitted = maybeSubmitStage2(frame, tick.smoke_detections);
    }

    updateFps();
    tick.state = aggregator_.snapshot();

    if (annotate && !frame.image.empty())
    {
        tick.annotated = frame.image.clone();
        std::vector<Detection> overlay = tick.smoke_detections;
        for (const auto &box : tick.state.fire_boxes)
        {
            Detection det;
            det.cls = DetectionClass::FIRE;
            det.confidence = tick.state.fire_max_conf;
            det.box = box;
            overlay.push_back(det);
        }
        draw_detections(tick.annotated, overlay);
        draw_status_overlay(tick.annotated, tick.state, frame.timestamp, config_.fire_hold_sec, fps());
    }
    return tick;
}

std::vector<Detection> StageScheduler::filterSmoke(const InferenceResult &result, const Frame &frame) const
{
    std::vector<Detection> smoke;
    if (result.status != InferenceStatus::OK)
    {
        return smoke;
    }

    for (const auto &det : result.detections)
    {
        if (det.cls != DetectionClass::SMOKE || det.confidence < config_.stage1.conf_threshold)
        {
            continue;
        }
        if (box_area_ratio(det.box, frame.image.size()) < config_.smoke_min_area)
        {
            continue;
        }
        Detection d = det;
        d.stage = StageId::STAGE1_SMOKE;
        d.frame_ts = frame.timestamp;
        smoke.push_back(d);
    }
    return smoke;
}

bool StageScheduler::maybeSubmitStage2(const Frame &frame, const std::vector<Detection> &smoke)
{
    auto logger = logging::get_logger();

    if (stage2_.faulted())
    {
        aggregator_.markStageFault(StageId::STAGE2_FIRE);
        if (!stage2_fault_reported_)
        {
            stage2_fault_reported_ = true;
            logger->error("[stage2] {}：降级为仅烟雾检测", errorKindToString(ErrorKind::INFERENCE_HARDWARE_FAULT));
        }
        return false;
    }

    if (config_.fire_check_cooldown_sec > 0.0 && last_stage2_submit_ &&
        seconds_between(*last_stage2_submit_, frame.timestamp) < config_.fire_check_cooldown_sec)
    {
        return false;
    }

    const cv::Rect roi = compute_roi(smoke, config_.roi_margin, frame.image.size());
    cv::Mat crop = frame.image(roi).clone();

    // 明火确认时需要整帧出图，拷贝一份随请求传递
    Frame frame_copy{frame.image.clone(), frame.timestamp, frame.seq};

    bool submitted = stage2_.submit(crop, [this, roi, frame_copy](const InferenceResult &r)
                                    { onStage2Result(r, roi, frame_copy); });
    if (!submitted)
    {
        if (stage2_.faulted())
        {
            aggregator_.markStageFault(StageId::STAGE2_FIRE);
        }
        else
        {
            aggregator_.markStage2Skipped();
            logger->debug("[stage2] 上一次确认仍在进行，跳过帧 {}", frame.seq);
        }
        return false;
    }

    stage2_invocations_++;
    last_stage2_submit_ = frame.timestamp;
    logger->debug("[stage2] 提交帧 {} ROI=({},{},{}x{})", frame.seq, roi.x, roi.y, roi.width, roi.height);
    return true;
}

// 在第二阶段会话的工作线程中执行
void StageScheduler::onStage2Result(const InferenceResult &result, const cv::Rect &roi, const Frame &frame)
{
    auto logger = logging::get_logger();

    if (result.status == InferenceStatus::TIMEOUT)
    {
        aggregator_.markStageTimeout(StageId::STAGE2_FIRE);
        logger->warn("[stage2] 帧 {} {}，结果丢弃", frame.seq, errorKindToString(ErrorKind::INFERENCE_TIMEOUT));
        return;
    }
    if (result.status == InferenceStatus::HARDWARE_FAULT)
    {
        aggregator_.markStageFault(StageId::STAGE2_FIRE);
        return;
    }

    // ROI 坐标换算回原图
    std::vector<Detection> fire;
    for (const auto &det : result.detections)
    {
        if (det.cls != DetectionClass::FIRE)
        {
            continue;
        }
        Detection d = det;
        d.box.x += roi.x;
        d.box.y += roi.y;
        d.stage = StageId::STAGE2_FIRE;
        d.frame_ts = frame.timestamp;
        fire.push_back(d);
    }

    AggregateUpdate update = aggregator_.update(StageId::STAGE2_FIRE, fire, frame.seq, frame.timestamp);
    if (!update.applied)
    {
        logger->debug("[stage2] 帧 {} 结果已过期，丢弃", frame.seq);
        return;
    }

    std::vector<Detection> confirmed;
    for (const auto &d : fire)
    {
        if (d.confidence >= aggregator_.config().fire_threshold)
        {
            confirmed.push_back(d);
        }
    }

    // 持续有火时每次命中都刷新抓拍
    if (!confirmed.empty())
    {
        FireHitSink hit_sink;
        {
            std::lock_guard<std::mutex> lock(sink_mutex_);
            hit_sink = fire_hit_sink_;
        }
        if (hit_sink)
        {
            try
            {
                hit_sink(frame, confirmed);
            }
            catch (const std::exception &e)
            {
                logger->error("明火抓拍处理异常: {}", e.what());
            }
        }
    }

    if (update.fire_rising)
    {
        logger->error("明火确认: conf={:.2f}, boxes={}, frame={}", update.state.fire_max_conf, update.state.fire_box_count, frame.seq);
        emit(DetectionClass::FIRE, update.state, frame, confirmed);
    }
}

void StageScheduler::emit(DetectionClass kind, const AggregateState &state, const Frame &frame, const std::vector<Detection> &detections)
{
    DetectionEventSink sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink = sink_;
    }
    if (!sink)
    {
        return;
    }

    DetectionEvent event;
    event.kind = kind;
    event.snapshot = state;
    event.frame = frame;
    event.detections = detections;

    try
    {
        sink(event);
    }
    catch (const std::exception &e)
    {
        logging::get_logger()->error("检测事件处理异常: {}", e.what());
    }
}

void StageScheduler::updateFps()
{
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(fps_mutex_);
    if (last_tick_.time_since_epoch().count() != 0)
    {
        double dt = std::chrono::duration<double>(now - last_tick_).count();
        if (dt > 0.0)
        {
            double inst = 1.0 / dt;
            fps_ = fps_ <= 0.0 ? inst : fps_ * 0.9 + inst * 0.1; // 指数平滑
        }
    }
    last_tick_ = now;
}

double StageScheduler::fps() const
{
    std::lock_guard<std::mutex> lock(fps_mutex_);
    return fps_;
}
