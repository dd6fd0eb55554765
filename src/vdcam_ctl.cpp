#include "core/config.hpp"
#include "ipc/control_plane.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: vdcam_ctl [--config <path>] <command> [args...]\n"
                  << "commands: status | devices | switch [unique_id] | pause | resume |\n"
                  << "          lifecycle active|inactive|background | flags key=0|1 ... |\n"
                  << "          permission | request-permission | open-settings |\n"
                  << "          entities | rectify <region_id> <path>\n";
        return 1;
    }

    int first = 1;
    std::string config_path = "config/config.yaml";
    if (std::string(argv[1]) == "--config") {
        if (argc < 4) {
            std::cerr << "missing command after --config <path>\n";
            return 1;
        }
        config_path = argv[2];
        first = 3;
    }

    vdcam::AppConfig cfg;
    std::string err;
    if (!vdcam::loadConfig(config_path, cfg, err)) {
        std::cerr << "config load failed: " << err << "\n";
        return 1;
    }

    std::string command;
    for (int i = first; i < argc; ++i) {
        if (!command.empty()) {
            command += ' ';
        }
        command += argv[i];
    }

    std::string response;
    if (!vdcam::ipc::unixControlRequest(cfg.control.socket_path, command + "\n", response, err)) {
        std::cerr << "control request failed: " << err << "\n";
        return 1;
    }

    std::cout << response;
    return response.rfind("OK", 0) == 0 ? 0 : 2;
}
