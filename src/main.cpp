#include <iostream>
#include <string>
#include <vector>
#include "schedule_cmd.hpp"

static void print_usage() {
    std::cout << "Usage: wakeprompt <command> [options]\n\n"
              << "Commands:\n"
              << "  add --project DIR --prompt TEXT <schedule> [options]\n"
              << "                              Schedule a prompt\n"
              << "        schedule: --once YYYY-MM-DD HH:MM | --daily HH:MM | --weekly DAY HH:MM\n"
              << "        options:  --session ID --session-path FILE | --new-session\n"
              << "                  --model M  --permission-mode P  --timezone ZONE\n"
              << "  edit <id> [same options]    Change a schedule\n"
              << "  remove <id>                 Delete a schedule and its launchd job\n"
              << "  list                        Show schedules by next run\n"
              << "  logs [--limit N]            Show recent runs\n"
              << "  sessions --project DIR      List a project's sessions\n"
              << "  prune                       Apply log retention now\n"
              << "  init                        Write a default config file\n"
              << "  help                        Show this message\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    try {
        if (cmd == "--run") {
            if (args.size() != 1) {
                std::cerr << "Usage: wakeprompt --run <id>\n";
                return 1;
            }
            return wakeprompt::cmd_run(args[0]);
        }
        else if (cmd == "add") {
            return wakeprompt::cmd_add(args);
        }
        else if (cmd == "edit") {
            return wakeprompt::cmd_edit(args);
        }
        else if (cmd == "remove") {
            return wakeprompt::cmd_remove(args);
        }
        else if (cmd == "list") {
            return wakeprompt::cmd_list();
        }
        else if (cmd == "logs") {
            return wakeprompt::cmd_logs(args);
        }
        else if (cmd == "sessions") {
            return wakeprompt::cmd_sessions(args);
        }
        else if (cmd == "prune") {
            return wakeprompt::cmd_prune();
        }
        else if (cmd == "init") {
            return wakeprompt::cmd_init(wakeprompt::default_config_path());
        }
        else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        }
        else {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
