#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace vdcam {

// What the host platform reports.
enum class AuthorizationStatus {
    NotDetermined,
    Restricted,
    Denied,
    Authorized,
};

// What the rest of the core sees. Restricted collapses into Granted.
enum class PermissionState {
    Undetermined,
    Denied,
    Granted,
};

enum class PermissionAdvice {
    None,
    RequestAccess,
    OpenSettings,
};

const char* toString(AuthorizationStatus status);
const char* toString(PermissionState state);
const char* toString(PermissionAdvice advice);

PermissionState permissionStateFor(AuthorizationStatus status);

class PermissionHost {
public:
    virtual ~PermissionHost() = default;

    virtual AuthorizationStatus authorizationStatus() const = 0;
    // Shows the platform prompt. `done` may be called on any thread.
    virtual void requestAccess(std::function<void(bool granted)> done) = 0;
    virtual void openSettings() = 0;
};

class PermissionGate {
public:
    using Completion = std::function<void(PermissionState)>;
    using Listener = std::function<void(PermissionState)>;
    using ListenerToken = uint64_t;

    explicit PermissionGate(PermissionHost& host);
    ~PermissionGate();

    PermissionGate(const PermissionGate&) = delete;
    PermissionGate& operator=(const PermissionGate&) = delete;

    PermissionState queryAuthorization() const;

    // Undetermined: prompts once; concurrent callers share the pending prompt.
    // Denied: opens the settings surface and completes with Denied at once.
    // Granted/restricted: completes at once.
    void requestAuthorization(Completion completion);
    bool requestInFlight() const;

    void openSettings();
    PermissionAdvice advice() const;
    bool permissionGranted() const { return queryAuthorization() == PermissionState::Granted; }
    bool permissionDenied() const { return queryAuthorization() == PermissionState::Denied; }

    ListenerToken addListener(Listener listener);
    void removeListener(ListenerToken token);

    // Re-reads the host status and notifies listeners when it changed since
    // the last observation. Returns the current state.
    PermissionState poll();

    void startMonitoring(int interval_ms);
    void stopMonitoring();
    bool isMonitoring() const;

private:
    void onPromptFinished(bool granted);
    void publishIfChanged(PermissionState state);

    PermissionHost& host_;

    mutable std::mutex mutex_;
    bool prompt_in_flight_{false};
    std::vector<Completion> pending_;
    PermissionState last_published_{PermissionState::Undetermined};
    bool has_published_{false};
    std::map<ListenerToken, Listener> listeners_;
    ListenerToken next_token_{1};

    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    bool monitor_stop_{false};
    std::thread monitor_;
};

}  // namespace vdcam
