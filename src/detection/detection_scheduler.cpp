#include "detection/detection_scheduler.hpp"

#include <chrono>
#include <iostream>

#include "core/time_utils.hpp"

namespace vdcam {

const char* toString(FrameDecision decision) {
    switch (decision) {
        case FrameDecision::Dropped: return "dropped";
        case FrameDecision::Idle: return "idle";
        case FrameDecision::Detection: return "detection";
        case FrameDecision::Tracking: return "tracking";
    }
    return "unknown";
}

DetectionScheduler::DetectionScheduler(
    const SchedulerConfig& config,
    VisionDetector& detector,
    TrackedEntityStore& store)
    : detect_interval_ns_(msToNs(config.detect_interval_ms)),
      track_interval_ns_(msToNs(config.track_interval_ms)),
      detector_(detector),
      store_(store) {
    worker_ = std::thread(&DetectionScheduler::visionLoop, this);
}

DetectionScheduler::~DetectionScheduler() {
    stop();
}

void DetectionScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(job_mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    job_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void DetectionScheduler::prime(int64_t now_ns) {
    epoch_.fetch_add(1);
    next_detect_ns_.store(now_ns);
    next_track_ns_.store(now_ns);
}

void DetectionScheduler::forget() {
    epoch_.fetch_add(1);
    reset_requested_.store(true);
    store_.forget();
}

void DetectionScheduler::setDetectionKinds(const DetectionKinds& kinds) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    kinds_ = kinds;
}

DetectionKinds DetectionScheduler::detectionKinds() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return kinds_;
}

void DetectionScheduler::setEntityListener(EntityListener listener) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    listener_ = std::move(listener);
}

FrameDecision DetectionScheduler::submitFrame(const FramePacket& frame) {
    telemetry_.countFrame();

    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        telemetry_.countDroppedBusy();
        return FrameDecision::Dropped;
    }

    Job job;
    job.frame = frame;
    job.epoch = epoch_.load();
    job.kinds = detectionKinds();

    if (frame.timestamp_ns >= next_detect_ns_.load() && job.kinds.any()) {
        job.kind = PassKind::Detection;
        job.generation = store_.generation();
    } else if (frame.timestamp_ns >= next_track_ns_.load() && store_.hasTrackingRequests()) {
        job.kind = PassKind::Tracking;
        job.generation = store_.generation();
        job.requests = store_.trackingRequests();
        // Requests are stamped with the generation they were issued under.
        if (job.requests.empty() || job.requests.front().generation != job.generation) {
            finishPass();
            telemetry_.countIdle();
            return FrameDecision::Idle;
        }
    } else {
        finishPass();
        telemetry_.countIdle();
        return FrameDecision::Idle;
    }

    const FrameDecision decision =
        (job.kind == PassKind::Detection) ? FrameDecision::Detection : FrameDecision::Tracking;
    {
        std::lock_guard<std::mutex> lock(job_mutex_);
        if (stopping_) {
            busy_.store(false);
            return FrameDecision::Idle;
        }
        job_ = std::move(job);
        has_job_ = true;
    }
    job_cv_.notify_one();
    return decision;
}

void DetectionScheduler::visionLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(job_mutex_);
            job_cv_.wait(lock, [this]() { return stopping_ || has_job_; });
            if (stopping_ && !has_job_) {
                break;
            }
            job = std::move(job_);
            has_job_ = false;
        }
        runPass(job);
        finishPass();
    }
    finishPass();
}

void DetectionScheduler::runPass(Job& job) {
    if (reset_requested_.exchange(false)) {
        detector_.reset();
    }

    Observations observations;
    std::string error;
    bool ok = false;
    try {
        if (job.kind == PassKind::Detection) {
            ok = detector_.detect(job.frame.bgr, job.kinds, observations, error);
        } else {
            ok = detector_.track(job.frame.bgr, job.requests, observations, error);
        }
    } catch (const std::exception& e) {
        ok = false;
        error = e.what();
    }
    if (!ok) {
        telemetry_.countDetectorFailure();
        std::cerr << "scheduler: " << toString(job.kind) << " pass failed on frame "
                  << job.frame.sequence_id << ": " << error << '\n';
        observations.clear();
    }

    if (job.kind == PassKind::Detection) {
        telemetry_.countDetectionPass();
    } else {
        telemetry_.countTrackingPass();
    }

    if (job.epoch != epoch_.load() ||
        !store_.commit(job.kind, observations, job.generation, job.frame.timestamp_ns, job.frame.bgr)) {
        telemetry_.countDiscardedPass();
        return;
    }

    if (job.kind == PassKind::Detection) {
        next_detect_ns_.store(job.frame.timestamp_ns + detect_interval_ns_);
    }
    next_track_ns_.store(job.frame.timestamp_ns + track_interval_ns_);

    EntityListener listener;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(store_.snapshot());
    }
}

void DetectionScheduler::finishPass() {
    {
        std::lock_guard<std::mutex> lock(job_mutex_);
        busy_.store(false);
    }
    idle_cv_.notify_all();
}

bool DetectionScheduler::waitIdle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(job_mutex_);
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() {
        return !busy_.load() && !has_job_;
    });
}

}  // namespace vdcam
