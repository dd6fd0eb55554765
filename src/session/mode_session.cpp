#include "session/mode_session.hpp"

namespace vdcam {

UnavailableModeSession::UnavailableModeSession(std::string mode_name)
    : mode_name_(std::move(mode_name)) {}

bool UnavailableModeSession::start(std::string& error) {
    error = mode_name_ + " mode is not available on this host";
    return false;
}

}  // namespace vdcam
