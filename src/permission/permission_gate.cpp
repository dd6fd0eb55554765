#include "permission/permission_gate.hpp"

#include <chrono>
#include <iostream>

namespace vdcam {

const char* toString(AuthorizationStatus status) {
    switch (status) {
        case AuthorizationStatus::NotDetermined: return "not_determined";
        case AuthorizationStatus::Restricted: return "restricted";
        case AuthorizationStatus::Denied: return "denied";
        case AuthorizationStatus::Authorized: return "authorized";
    }
    return "unknown";
}

const char* toString(PermissionState state) {
    switch (state) {
        case PermissionState::Undetermined: return "undetermined";
        case PermissionState::Denied: return "denied";
        case PermissionState::Granted: return "granted";
    }
    return "unknown";
}

const char* toString(PermissionAdvice advice) {
    switch (advice) {
        case PermissionAdvice::None: return "none";
        case PermissionAdvice::RequestAccess: return "request_access";
        case PermissionAdvice::OpenSettings: return "open_settings";
    }
    return "unknown";
}

PermissionState permissionStateFor(AuthorizationStatus status) {
    switch (status) {
        case AuthorizationStatus::Authorized:
        case AuthorizationStatus::Restricted:
            return PermissionState::Granted;
        case AuthorizationStatus::Denied:
            return PermissionState::Denied;
        case AuthorizationStatus::NotDetermined:
            break;
    }
    return PermissionState::Undetermined;
}

PermissionGate::PermissionGate(PermissionHost& host)
    : host_(host) {}

PermissionGate::~PermissionGate() {
    stopMonitoring();
}

PermissionState PermissionGate::queryAuthorization() const {
    return permissionStateFor(host_.authorizationStatus());
}

void PermissionGate::requestAuthorization(Completion completion) {
    const PermissionState state = queryAuthorization();
    if (state == PermissionState::Granted) {
        if (completion) {
            completion(state);
        }
        return;
    }
    if (state == PermissionState::Denied) {
        std::cerr << "permission: camera access denied, opening settings\n";
        host_.openSettings();
        if (completion) {
            completion(state);
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (completion) {
            pending_.push_back(std::move(completion));
        }
        if (prompt_in_flight_) {
            return;
        }
        prompt_in_flight_ = true;
    }
    std::cerr << "permission: requesting camera access\n";
    host_.requestAccess([this](bool granted) { onPromptFinished(granted); });
}

void PermissionGate::onPromptFinished(bool granted) {
    std::vector<Completion> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prompt_in_flight_ = false;
        pending.swap(pending_);
    }

    const PermissionState reported = queryAuthorization();
    PermissionState state = reported;
    if (state == PermissionState::Undetermined) {
        state = granted ? PermissionState::Granted : PermissionState::Denied;
    }
    std::cerr << "permission: prompt finished, " << toString(state) << '\n';

    for (auto& done : pending) {
        done(state);
    }
    // Listeners follow the host so that poll() never reverts what they saw.
    publishIfChanged(reported);
}

bool PermissionGate::requestInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prompt_in_flight_;
}

void PermissionGate::openSettings() {
    host_.openSettings();
}

PermissionAdvice PermissionGate::advice() const {
    switch (queryAuthorization()) {
        case PermissionState::Undetermined: return PermissionAdvice::RequestAccess;
        case PermissionState::Denied: return PermissionAdvice::OpenSettings;
        case PermissionState::Granted: break;
    }
    return PermissionAdvice::None;
}

PermissionGate::ListenerToken PermissionGate::addListener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    const ListenerToken token = next_token_++;
    listeners_[token] = std::move(listener);
    if (!has_published_) {
        last_published_ = permissionStateFor(host_.authorizationStatus());
        has_published_ = true;
    }
    return token;
}

void PermissionGate::removeListener(ListenerToken token) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(token);
}

void PermissionGate::publishIfChanged(PermissionState state) {
    std::vector<Listener> to_notify;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (has_published_ && last_published_ == state) {
            return;
        }
        const bool first = !has_published_;
        last_published_ = state;
        has_published_ = true;
        if (first) {
            return;
        }
        for (const auto& kv : listeners_) {
            to_notify.push_back(kv.second);
        }
    }
    std::cerr << "permission: state changed to " << toString(state) << '\n';
    for (auto& listener : to_notify) {
        listener(state);
    }
}

PermissionState PermissionGate::poll() {
    const PermissionState state = queryAuthorization();
    publishIfChanged(state);
    return state;
}

void PermissionGate::startMonitoring(int interval_ms) {
    stopMonitoring();
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_stop_ = false;
    }
    poll();
    monitor_ = std::thread([this, interval_ms]() {
        std::unique_lock<std::mutex> lock(monitor_mutex_);
        while (!monitor_stop_) {
            monitor_cv_.wait_for(lock, std::chrono::milliseconds(interval_ms), [this]() { return monitor_stop_; });
            if (monitor_stop_) {
                break;
            }
            lock.unlock();
            poll();
            lock.lock();
        }
    });
}

void PermissionGate::stopMonitoring() {
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_stop_ = true;
    }
    monitor_cv_.notify_all();
    if (monitor_.joinable()) {
        monitor_.join();
    }
}

bool PermissionGate::isMonitoring() const {
    return monitor_.joinable();
}

}  // namespace vdcam
