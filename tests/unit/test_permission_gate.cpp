#include "permission/permission_gate.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <vector>

#include "support/fakes.hpp"

using vdcam::AuthorizationStatus;
using vdcam::PermissionState;

int main() {
    if (vdcam::permissionStateFor(AuthorizationStatus::Restricted) != PermissionState::Granted ||
        vdcam::permissionStateFor(AuthorizationStatus::NotDetermined) != PermissionState::Undetermined ||
        vdcam::permissionStateFor(AuthorizationStatus::Denied) != PermissionState::Denied) {
        std::cerr << "host status mapping mismatch\n";
        return 1;
    }

    // Undetermined: one prompt shared by concurrent requests.
    {
        vdcam::testing::FakePermissionHost host(AuthorizationStatus::NotDetermined);
        vdcam::PermissionGate gate(host);
        if (gate.advice() != vdcam::PermissionAdvice::RequestAccess) {
            std::cerr << "undetermined permission should advise requesting access\n";
            return 1;
        }

        std::vector<PermissionState> results;
        std::mutex results_mutex;
        auto record = [&](PermissionState s) {
            std::lock_guard<std::mutex> lock(results_mutex);
            results.push_back(s);
        };
        std::atomic<int> changes{0};
        gate.addListener([&](PermissionState s) {
            if (s == PermissionState::Granted) {
                changes.fetch_add(1);
            }
        });

        gate.requestAuthorization(record);
        gate.requestAuthorization(record);
        if (host.prompts() != 1 || !gate.requestInFlight()) {
            std::cerr << "a second request while prompting must not prompt again\n";
            return 1;
        }
        if (!results.empty()) {
            std::cerr << "completions should wait for the prompt\n";
            return 1;
        }

        host.answer(true);
        if (results.size() != 2U || results[0] != PermissionState::Granted || results[1] != PermissionState::Granted) {
            std::cerr << "both completions should receive the prompt result\n";
            return 1;
        }
        if (gate.requestInFlight() || !gate.permissionGranted() || changes.load() != 1) {
            std::cerr << "granting should settle the gate and notify listeners once\n";
            return 1;
        }

        // Granted: completes at once, no prompt.
        results.clear();
        gate.requestAuthorization(record);
        if (host.prompts() != 1 || results.size() != 1U || results[0] != PermissionState::Granted) {
            std::cerr << "granted request should complete without prompting\n";
            return 1;
        }
        if (gate.advice() != vdcam::PermissionAdvice::None) {
            std::cerr << "granted permission needs no advice\n";
            return 1;
        }
    }

    // Prompt answered with "deny".
    {
        vdcam::testing::FakePermissionHost host(AuthorizationStatus::NotDetermined);
        vdcam::PermissionGate gate(host);
        PermissionState result = PermissionState::Undetermined;
        gate.requestAuthorization([&](PermissionState s) { result = s; });
        host.answer(false);
        if (result != PermissionState::Denied || !gate.permissionDenied()) {
            std::cerr << "declined prompt should complete with denied\n";
            return 1;
        }
    }

    // Denied: no prompt, the settings surface is opened instead.
    {
        vdcam::testing::FakePermissionHost host(AuthorizationStatus::Denied);
        vdcam::PermissionGate gate(host);
        PermissionState result = PermissionState::Undetermined;
        gate.requestAuthorization([&](PermissionState s) { result = s; });
        if (host.prompts() != 0 || host.settingsOpened() != 1 || result != PermissionState::Denied) {
            std::cerr << "denied request should open settings and complete with denied\n";
            return 1;
        }
        if (gate.advice() != vdcam::PermissionAdvice::OpenSettings) {
            std::cerr << "denied permission should advise opening settings\n";
            return 1;
        }
    }

    // Restricted behaves like granted.
    {
        vdcam::testing::FakePermissionHost host(AuthorizationStatus::Restricted);
        vdcam::PermissionGate gate(host);
        PermissionState result = PermissionState::Undetermined;
        gate.requestAuthorization([&](PermissionState s) { result = s; });
        if (result != PermissionState::Granted || host.prompts() != 0) {
            std::cerr << "restricted should complete as granted\n";
            return 1;
        }
    }

    // Changes made outside the app are picked up by polling.
    {
        vdcam::testing::FakePermissionHost host(AuthorizationStatus::Authorized);
        vdcam::PermissionGate gate(host);
        std::atomic<int> revoked{0};
        std::atomic<int> granted{0};
        const auto token = gate.addListener([&](PermissionState s) {
            if (s == PermissionState::Denied) {
                revoked.fetch_add(1);
            } else if (s == PermissionState::Granted) {
                granted.fetch_add(1);
            }
        });

        gate.poll();
        if (revoked.load() != 0 || granted.load() != 0) {
            std::cerr << "unchanged state must not notify\n";
            return 1;
        }

        gate.startMonitoring(5);
        host.setStatus(AuthorizationStatus::Denied);
        if (!vdcam::testing::waitFor([&]() { return revoked.load() == 1; }, 2000)) {
            std::cerr << "monitor should report the revocation\n";
            return 1;
        }
        host.setStatus(AuthorizationStatus::Authorized);
        if (!vdcam::testing::waitFor([&]() { return granted.load() == 1; }, 2000)) {
            std::cerr << "monitor should report the re-grant\n";
            return 1;
        }
        gate.stopMonitoring();
        if (gate.isMonitoring()) {
            std::cerr << "monitor should stop\n";
            return 1;
        }

        gate.removeListener(token);
        host.setStatus(AuthorizationStatus::Denied);
        gate.poll();
        if (revoked.load() != 1) {
            std::cerr << "removed listener must not be notified\n";
            return 1;
        }
    }

    // The prompt answer goes to the requester; listeners only hear what the host reports.
    {
        vdcam::testing::FakePermissionHost host(AuthorizationStatus::NotDetermined);
        vdcam::PermissionGate gate(host);
        std::vector<PermissionState> heard;
        std::mutex heard_mutex;
        gate.addListener([&](PermissionState s) {
            std::lock_guard<std::mutex> lock(heard_mutex);
            heard.push_back(s);
        });

        PermissionState result = PermissionState::Undetermined;
        gate.requestAuthorization([&](PermissionState s) { result = s; });
        host.answerWithoutRecording(false);
        if (result != PermissionState::Denied) {
            std::cerr << "refused prompt should complete as denied\n";
            return 1;
        }
        gate.poll();
        gate.poll();
        {
            std::lock_guard<std::mutex> lock(heard_mutex);
            if (!heard.empty()) {
                std::cerr << "host still reports undetermined, listeners must not see a change\n";
                return 1;
            }
        }
        if (gate.queryAuthorization() != PermissionState::Undetermined) {
            std::cerr << "query should follow the host\n";
            return 1;
        }

        host.setStatus(AuthorizationStatus::Authorized);
        gate.poll();
        std::lock_guard<std::mutex> lock(heard_mutex);
        if (heard.size() != 1U || heard.front() != PermissionState::Granted) {
            std::cerr << "a real host change should notify once\n";
            return 1;
        }
    }

    return 0;
}
